#ifndef CUTTINGSTOCKENV_H
#define CUTTINGSTOCKENV_H

#include "CuttingTypes.h"
#include <cstdint>
#include <random>
#include <vector>

struct EnvConfig {
    int num_stocks = 10;
    int min_stock_size = 10;
    int max_stock_size = 20;
    int num_product_types = 5;
    int min_product_size = 1;
    int max_product_size = 8;   // must not exceed min_stock_size
    int min_quantity = 1;
    int max_quantity = 5;
    int max_steps = 1000;       // episode is truncated after this many steps
    uint32_t seed = 42;

    // Throws std::invalid_argument
    void validate() const;
};

struct EnvStep {
    Observation observation;
    StepInfo info;
    bool accepted = false;     // the placement was applied
    bool terminated = false;   // all demand placed
    bool truncated = false;    // step limit reached
};

/**
 * @brief Small cutting-stock simulator
 *
 * Owns the stock grids and the product demand. A placement is applied only
 * if its size matches an eligible product in either orientation and the
 * target rectangle is free; cells are tagged with the product's index.
 * Everything else is counted as an invalid placement and leaves the state
 * unchanged.
 *
 * info.filledRatio is the fraction of stocks that carry any material.
 */
class CuttingStockEnv {
public:
    explicit CuttingStockEnv(const EnvConfig& config = EnvConfig{});

    // New random instance from the configured seed stream
    EnvStep reset();
    EnvStep reset(uint32_t seed);

    // Fixed instance, mainly for tests
    EnvStep reset(std::vector<StockGrid> stocks, std::vector<ProductDemand> products);

    EnvStep step(const Decision& placement);

    const Observation& observation() const { return m_obs; }
    StepInfo info() const;

    int stepCount() const { return m_steps; }
    int invalidPlacements() const { return m_invalid; }
    bool isTerminated() const { return remainingDemand(m_obs) == 0; }

private:
    EnvStep snapshot(bool accepted) const;
    bool apply(const Placement& placement);

    EnvConfig m_config;
    std::mt19937 m_rng;
    Observation m_obs;
    int m_steps = 0;
    int m_invalid = 0;
};

#endif // CUTTINGSTOCKENV_H
