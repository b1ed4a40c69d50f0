#ifndef ADVANTAGEESTIMATOR_H
#define ADVANTAGEESTIMATOR_H

#include <Eigen/Core>
#include <vector>

struct AdvantageResult {
    Eigen::VectorXf advantages;
    Eigen::VectorXf returns;   // advantages + value estimates
};

/**
 * @brief Generalized Advantage Estimation over one trajectory
 *
 * delta_t = r_t + gamma * V(t+1) * (1 - done_t) - V(t),  V(n) = 0
 * A_t     = delta_t + gamma * lambda * (1 - done_t) * A_{t+1}
 */
class AdvantageEstimator {
public:
    AdvantageEstimator(float gamma = 0.99f, float lambda = 0.95f);

    AdvantageResult compute(const Eigen::VectorXf& rewards,
                            const Eigen::VectorXf& values,
                            const std::vector<bool>& dones) const;

    // (x - mean) / (sample std + eps); a single element has std 0
    static Eigen::VectorXf standardize(const Eigen::VectorXf& x, float eps = 1e-8f);

    float gamma() const { return m_gamma; }
    float lambda() const { return m_lambda; }

private:
    float m_gamma;
    float m_lambda;
};

#endif // ADVANTAGEESTIMATOR_H
