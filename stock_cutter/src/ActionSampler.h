#ifndef ACTIONSAMPLER_H
#define ACTIONSAMPLER_H

#include "PolicyConfig.h"
#include <Eigen/Core>
#include <random>

struct SampledAction {
    int action = 0;
    float logProb = 0.0f;   // under the boosted, tempered distribution
};

/**
 * @brief Categorical sampling over actor logits
 *
 * Before sampling, the logits of the preferred stock's unrotated cells get
 * an additive boost that decays from boost_start to boost_min, and every
 * logit is divided by a temperature that decays from 1 to temperature_min.
 */
class ActionSampler {
public:
    explicit ActionSampler(const PolicyConfig& config);

    float stockBoost(long steps) const;
    float temperature(long steps) const;

    // Logits after boost and temperature; preferredStock < 0 disables the boost
    Eigen::VectorXf shapeLogits(const Eigen::VectorXf& logits, int preferredStock, long steps) const;

    SampledAction sample(const Eigen::VectorXf& logits, int preferredStock, long steps,
                         std::mt19937& rng) const;

    static Eigen::VectorXf logSoftmax(const Eigen::VectorXf& logits);

private:
    PolicyConfig m_config;
};

#endif // ACTIONSAMPLER_H
