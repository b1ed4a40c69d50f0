#include "AdamOptimizer.h"
#include <algorithm>
#include <limits>

AdamOptimizer::AdamOptimizer(int size, float learningRate, float beta1, float beta2, float epsilon)
    : m_lr(learningRate)
    , m_beta1(beta1)
    , m_beta2(beta2)
    , m_epsilon(epsilon)
    , m_m(Eigen::VectorXf::Zero(size))
    , m_v(Eigen::VectorXf::Zero(size))
    , m_t(0)
{
}

Eigen::VectorXf AdamOptimizer::step(const Eigen::VectorXf& gradient)
{
    m_t++;

    // m_t = beta1 * m_{t-1} + (1 - beta1) * g_t
    m_m = m_beta1 * m_m + (1.0f - m_beta1) * gradient;

    // v_t = beta2 * v_{t-1} + (1 - beta2) * g_t^2
    m_v = m_beta2 * m_v + (1.0f - m_beta2) * gradient.array().square().matrix();

    // m_hat_t = m_t / (1 - beta1^t)
    Eigen::VectorXf m_hat = m_m / (1.0f - std::pow(m_beta1, m_t));

    // v_hat_t = v_t / (1 - beta2^t)
    Eigen::VectorXf v_hat = m_v / (1.0f - std::pow(m_beta2, m_t));

    // theta_t = theta_{t-1} - alpha * m_hat_t / (sqrt(v_hat_t) + epsilon)
    Eigen::VectorXf update = (m_lr * m_hat.array() / (v_hat.array().sqrt() + m_epsilon)).matrix();

    return update;
}

void AdamOptimizer::reset()
{
    m_m.setZero();
    m_v.setZero();
    m_t = 0;
}

bool AdamOptimizer::restore(int timestep, float learningRate, const Eigen::VectorXf& m, const Eigen::VectorXf& v)
{
    if (m.size() != m_m.size() || v.size() != m_v.size() || timestep < 0) return false;
    m_t = timestep;
    m_lr = learningRate;
    m_m = m;
    m_v = v;
    return true;
}

PlateauScheduler::PlateauScheduler(AdamOptimizer* optimizer, Mode mode, float factor,
                                   int patience, float threshold, float minLr)
    : m_optimizer(optimizer)
    , m_mode(mode)
    , m_factor(factor)
    , m_patience(patience)
    , m_threshold(threshold)
    , m_minLr(minLr)
    , m_best(mode == Mode::Max ? -std::numeric_limits<float>::infinity()
                               : std::numeric_limits<float>::infinity())
{
}

bool PlateauScheduler::isBetter(float metric) const
{
    if (m_mode == Mode::Max) {
        return metric > m_best * (1.0f + m_threshold);
    }
    return metric < m_best * (1.0f - m_threshold);
}

bool PlateauScheduler::step(float metric)
{
    if (isBetter(metric)) {
        m_best = metric;
        m_badSteps = 0;
        return false;
    }

    if (++m_badSteps <= m_patience) return false;

    m_badSteps = 0;
    float oldLr = m_optimizer->learningRate();
    float newLr = std::max(oldLr * m_factor, m_minLr);
    if (oldLr - newLr <= 1e-8f) return false;

    m_optimizer->setLearningRate(newLr);
    return true;
}
