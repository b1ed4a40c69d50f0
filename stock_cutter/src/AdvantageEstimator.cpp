#include "AdvantageEstimator.h"
#include <cmath>
#include <stdexcept>

AdvantageEstimator::AdvantageEstimator(float gamma, float lambda)
    : m_gamma(gamma)
    , m_lambda(lambda)
{
}

AdvantageResult AdvantageEstimator::compute(const Eigen::VectorXf& rewards,
                                            const Eigen::VectorXf& values,
                                            const std::vector<bool>& dones) const {
    const int n = static_cast<int>(rewards.size());
    if (values.size() != n || static_cast<int>(dones.size()) != n) {
        throw std::invalid_argument("AdvantageEstimator: trajectory lengths differ");
    }

    AdvantageResult result;
    result.advantages = Eigen::VectorXf::Zero(n);

    float gae = 0.0f;
    for (int t = n - 1; t >= 0; --t) {
        float nextValue = (t == n - 1) ? 0.0f : values(t + 1);
        float notDone = dones[t] ? 0.0f : 1.0f;

        float delta = rewards(t) + m_gamma * nextValue * notDone - values(t);
        gae = delta + m_gamma * m_lambda * notDone * gae;
        result.advantages(t) = gae;
    }

    result.returns = result.advantages + values;
    return result;
}

Eigen::VectorXf AdvantageEstimator::standardize(const Eigen::VectorXf& x, float eps) {
    if (x.size() == 0) return x;

    float mean = x.mean();
    float stddev = 0.0f;
    if (x.size() > 1) {
        float sq = (x.array() - mean).square().sum();
        stddev = std::sqrt(sq / static_cast<float>(x.size() - 1));
    }

    return ((x.array() - mean) / (stddev + eps)).matrix();
}
