#include "CuttingStockEnv.h"
#include "PatternEvaluator.h"
#include <stdexcept>
#include <string>
#include <utility>

void EnvConfig::validate() const {
    auto require = [](bool condition, const char* field) {
        if (!condition) throw std::invalid_argument(std::string("EnvConfig: invalid ") + field);
    };

    require(num_stocks > 0, "num_stocks");
    require(min_stock_size > 0 && max_stock_size >= min_stock_size, "stock size range");
    require(num_product_types > 0, "num_product_types");
    require(min_product_size > 0 && max_product_size >= min_product_size, "product size range");
    require(max_product_size <= min_stock_size, "max_product_size");
    require(min_quantity > 0 && max_quantity >= min_quantity, "quantity range");
    require(max_steps > 0, "max_steps");
}

CuttingStockEnv::CuttingStockEnv(const EnvConfig& config)
    : m_config(config)
    , m_rng(config.seed)
{
    m_config.validate();
}

EnvStep CuttingStockEnv::reset(uint32_t seed) {
    m_rng.seed(seed);
    return reset();
}

EnvStep CuttingStockEnv::reset() {
    std::uniform_int_distribution<int> stockSize(m_config.min_stock_size, m_config.max_stock_size);
    std::uniform_int_distribution<int> productSize(m_config.min_product_size, m_config.max_product_size);
    std::uniform_int_distribution<int> quantity(m_config.min_quantity, m_config.max_quantity);

    std::vector<StockGrid> stocks;
    stocks.reserve(m_config.num_stocks);
    for (int i = 0; i < m_config.num_stocks; ++i) {
        int w = stockSize(m_rng);
        int h = stockSize(m_rng);
        stocks.push_back(makeEmptyStock(w, h));
    }

    std::vector<ProductDemand> products;
    products.reserve(m_config.num_product_types);
    for (int i = 0; i < m_config.num_product_types; ++i) {
        ProductDemand product;
        product.width = productSize(m_rng);
        product.height = productSize(m_rng);
        product.quantity = quantity(m_rng);
        products.push_back(product);
    }

    return reset(std::move(stocks), std::move(products));
}

EnvStep CuttingStockEnv::reset(std::vector<StockGrid> stocks, std::vector<ProductDemand> products) {
    m_obs.stocks = std::move(stocks);
    m_obs.products = std::move(products);
    m_steps = 0;
    m_invalid = 0;
    return snapshot(false);
}

StepInfo CuttingStockEnv::info() const {
    StepInfo info;
    if (!m_obs.stocks.empty()) {
        info.filledRatio = static_cast<float>(usedStockCount(m_obs)) / static_cast<float>(m_obs.stocks.size());
    }
    return info;
}

EnvStep CuttingStockEnv::snapshot(bool accepted) const {
    EnvStep result;
    result.observation = m_obs;
    result.info = info();
    result.accepted = accepted;
    result.terminated = isTerminated();
    result.truncated = !result.terminated && m_steps >= m_config.max_steps;
    return result;
}

bool CuttingStockEnv::apply(const Placement& placement) {
    if (placement.stockIndex < 0 || placement.stockIndex >= static_cast<int>(m_obs.stocks.size())) {
        return false;
    }

    StockGrid& stock = m_obs.stocks[placement.stockIndex];
    if (!pattern::canPlace(stock, placement)) return false;

    for (int i = 0; i < static_cast<int>(m_obs.products.size()); ++i) {
        ProductDemand& product = m_obs.products[i];
        if (product.quantity <= 0) continue;

        bool matches = (product.width == placement.width && product.height == placement.height) ||
                       (product.width == placement.height && product.height == placement.width);
        if (!matches) continue;

        stock.block(placement.x, placement.y, placement.width, placement.height).setConstant(i);
        --product.quantity;
        return true;
    }

    return false;
}

EnvStep CuttingStockEnv::step(const Decision& placement) {
    ++m_steps;

    bool accepted = placement && apply(*placement);
    if (!accepted) ++m_invalid;

    return snapshot(accepted);
}
