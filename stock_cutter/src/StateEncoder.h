#ifndef STATEENCODER_H
#define STATEENCODER_H

#include "CuttingTypes.h"
#include <Eigen/Core>

/**
 * @brief Fixed-length feature vector for the policy networks
 *
 * Layout:
 * - kMaxStocks x 3 stock features (width/10, height/10, occupancy)
 * - productSlots x 3 product features (width/10, height/10, min(qty,10)/10)
 * - 2 global features (filled ratio, steps/1000)
 *
 * The product slot count is fixed by initialize() and never changes; later
 * observations with more product types are truncated, fewer are zero-padded.
 */
class StateEncoder {
public:
    static constexpr int kMaxStocks = 100;
    static constexpr int kStockFeatures = 3;
    static constexpr int kProductFeatures = 3;
    static constexpr int kGlobalFeatures = 2;

    StateEncoder() = default;

    // Fixes the product slot count from the first observation. Idempotent.
    void initialize(const Observation& firstObservation);

    bool isInitialized() const { return m_productSlots >= 0; }
    int productSlots() const { return m_productSlots; }

    // Throws std::logic_error before initialize()
    int dimension() const;

    // Throws std::logic_error before initialize()
    Eigen::VectorXf encode(const Observation& obs, const StepInfo& info, long steps) const;

    static int dimensionFor(int productSlots) {
        return kMaxStocks * kStockFeatures + productSlots * kProductFeatures + kGlobalFeatures;
    }

private:
    int m_productSlots = -1;
};

/**
 * @brief Running mean/std used to standardise encoded states
 *
 * Both statistics decay as 0.99 * old + 0.01 * new. The new statistic is the
 * mean (resp. sample standard deviation) of the freshly encoded vector.
 */
class RunningNormalizer {
public:
    static constexpr float kDecay = 0.99f;
    static constexpr float kEpsilon = 1e-8f;

    RunningNormalizer() = default;
    explicit RunningNormalizer(int dimension);

    void reset(int dimension);

    Eigen::VectorXf normalize(const Eigen::VectorXf& state) const;
    void update(const Eigen::VectorXf& state);

    int dimension() const { return static_cast<int>(m_mean.size()); }

    const Eigen::VectorXf& mean() const { return m_mean; }
    const Eigen::VectorXf& stddev() const { return m_std; }

    // Returns false if the vector sizes do not match this normalizer
    bool restore(const Eigen::VectorXf& mean, const Eigen::VectorXf& stddev);

private:
    Eigen::VectorXf m_mean;
    Eigen::VectorXf m_std;
};

#endif // STATEENCODER_H
