#include "StateEncoder.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

void StateEncoder::initialize(const Observation& firstObservation) {
    if (isInitialized()) return;
    m_productSlots = static_cast<int>(firstObservation.products.size());
}

int StateEncoder::dimension() const {
    if (!isInitialized()) {
        throw std::logic_error("StateEncoder used before initialize()");
    }
    return dimensionFor(m_productSlots);
}

Eigen::VectorXf StateEncoder::encode(const Observation& obs, const StepInfo& info, long steps) const {
    Eigen::VectorXf state = Eigen::VectorXf::Zero(dimension());

    // Stock block, first kMaxStocks only
    int stockCount = std::min(static_cast<int>(obs.stocks.size()), kMaxStocks);
    for (int i = 0; i < stockCount; ++i) {
        const StockGrid& stock = obs.stocks[i];
        int base = i * kStockFeatures;
        state(base) = stockWidth(stock) / 10.0f;
        state(base + 1) = stockHeight(stock) / 10.0f;
        state(base + 2) = stockFillRatio(stock);
    }

    // Product block: eligible entries are packed from the front
    int productBase = kMaxStocks * kStockFeatures;
    int slot = 0;
    int considered = std::min(static_cast<int>(obs.products.size()), m_productSlots);
    for (int i = 0; i < considered; ++i) {
        const ProductDemand& product = obs.products[i];
        if (product.quantity <= 0) continue;

        int base = productBase + slot * kProductFeatures;
        state(base) = product.width / 10.0f;
        state(base + 1) = product.height / 10.0f;
        state(base + 2) = std::min(product.quantity, 10) / 10.0f;
        ++slot;
    }

    int globalBase = productBase + m_productSlots * kProductFeatures;
    state(globalBase) = info.filledRatio;
    state(globalBase + 1) = static_cast<float>(steps) / 1000.0f;

    return state;
}

RunningNormalizer::RunningNormalizer(int dimension) {
    reset(dimension);
}

void RunningNormalizer::reset(int dimension) {
    m_mean = Eigen::VectorXf::Zero(dimension);
    m_std = Eigen::VectorXf::Ones(dimension);
}

Eigen::VectorXf RunningNormalizer::normalize(const Eigen::VectorXf& state) const {
    return ((state - m_mean).array() / (m_std.array() + kEpsilon)).matrix();
}

void RunningNormalizer::update(const Eigen::VectorXf& state) {
    if (state.size() == 0 || state.size() != m_mean.size()) return;

    float mean = state.mean();
    float stddev = 0.0f;
    if (state.size() > 1) {
        float sq = (state.array() - mean).square().sum();
        stddev = std::sqrt(sq / static_cast<float>(state.size() - 1));
    }

    m_mean = kDecay * m_mean + Eigen::VectorXf::Constant(m_mean.size(), (1.0f - kDecay) * mean);
    m_std = kDecay * m_std + Eigen::VectorXf::Constant(m_std.size(), (1.0f - kDecay) * stddev);
}

bool RunningNormalizer::restore(const Eigen::VectorXf& mean, const Eigen::VectorXf& stddev) {
    if (mean.size() != m_mean.size() || stddev.size() != m_std.size()) return false;
    m_mean = mean;
    m_std = stddev;
    return true;
}
