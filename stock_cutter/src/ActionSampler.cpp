#include "ActionSampler.h"
#include "PlacementStrategies.h"
#include <algorithm>
#include <cmath>
#include <vector>

ActionSampler::ActionSampler(const PolicyConfig& config)
    : m_config(config)
{
}

float ActionSampler::stockBoost(long steps) const {
    return std::max(m_config.boost_start - static_cast<float>(steps) / m_config.boost_decay_steps,
                    m_config.boost_min);
}

float ActionSampler::temperature(long steps) const {
    return std::max(1.0f - static_cast<float>(steps) / m_config.temperature_decay_steps,
                    m_config.temperature_min);
}

Eigen::VectorXf ActionSampler::shapeLogits(const Eigen::VectorXf& logits, int preferredStock, long steps) const {
    Eigen::VectorXf shaped = logits;

    const int cells = ActionSpace::kCellsPerStock;
    int first = preferredStock * cells;
    if (preferredStock >= 0 && first + cells <= shaped.size()) {
        shaped.segment(first, cells).array() += stockBoost(steps);
    }

    return shaped / temperature(steps);
}

Eigen::VectorXf ActionSampler::logSoftmax(const Eigen::VectorXf& logits) {
    float maxLogit = logits.maxCoeff();
    Eigen::VectorXf shifted = logits.array() - maxLogit;
    float logSum = std::log(shifted.array().exp().sum());
    return shifted.array() - logSum;
}

SampledAction ActionSampler::sample(const Eigen::VectorXf& logits, int preferredStock, long steps,
                                    std::mt19937& rng) const {
    Eigen::VectorXf logProbs = logSoftmax(shapeLogits(logits, preferredStock, steps));

    std::vector<double> weights(logProbs.size());
    for (int i = 0; i < logProbs.size(); ++i) {
        weights[i] = std::exp(static_cast<double>(logProbs(i)));
    }
    std::discrete_distribution<int> dist(weights.begin(), weights.end());

    SampledAction result;
    result.action = dist(rng);
    result.logProb = logProbs(result.action);
    return result;
}
