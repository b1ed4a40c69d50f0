#ifndef ADAMOPTIMIZER_H
#define ADAMOPTIMIZER_H

#include <Eigen/Core>
#include <cmath>

/**
 * @brief Adam optimizer over one flat parameter vector
 *
 * Adam combines:
 * - Momentum (1st moment, beta1): remembers gradient direction
 * - RMSprop (2nd moment, beta2): adapts learning rate per parameter
 * - Bias correction: accounts for initialization bias
 *
 * References: Kingma & Ba (2014) "Adam: A Method for Stochastic Optimization"
 */
class AdamOptimizer
{
public:
    /**
     * @brief Construct Adam optimizer
     * @param size Number of parameters handled by this optimizer
     * @param learningRate Initial step size
     * @param beta1 Exponential decay rate for first moment (default: 0.9)
     * @param beta2 Exponential decay rate for second moment (default: 0.999)
     * @param epsilon Small constant for numerical stability (default: 1e-8)
     */
    explicit AdamOptimizer(int size, float learningRate = 1e-3f,
                           float beta1 = 0.9f, float beta2 = 0.999f, float epsilon = 1e-8f);

    /**
     * @brief Perform one Adam step
     * @param gradient Gradient of the loss w.r.t. the parameters
     * @return Delta to subtract from the parameters
     */
    Eigen::VectorXf step(const Eigen::VectorXf& gradient);

    /**
     * @brief Reset optimizer state (clear momentum moments)
     */
    void reset();

    float learningRate() const { return m_lr; }
    void setLearningRate(float lr) { m_lr = lr; }

    int timestep() const { return m_t; }
    int size() const { return static_cast<int>(m_m.size()); }

    const Eigen::VectorXf& firstMoment() const { return m_m; }
    const Eigen::VectorXf& secondMoment() const { return m_v; }

    // Returns false when the moment sizes do not match this optimizer
    bool restore(int timestep, float learningRate, const Eigen::VectorXf& m, const Eigen::VectorXf& v);

private:
    float m_lr;
    float m_beta1;
    float m_beta2;
    float m_epsilon;

    Eigen::VectorXf m_m;  // First moment (moving average of gradients)
    Eigen::VectorXf m_v;  // Second moment (moving average of squared gradients)
    int m_t;              // Timestep counter
};

/**
 * @brief Halves the learning rate when a tracked metric stops improving
 *
 * Improvement is relative: in Max mode a value must exceed best * (1 + threshold),
 * in Min mode it must fall below best * (1 - threshold). After more than
 * `patience` consecutive steps without improvement the rate is multiplied
 * by `factor`.
 */
class PlateauScheduler
{
public:
    enum class Mode { Min, Max };

    PlateauScheduler(AdamOptimizer* optimizer, Mode mode, float factor = 0.5f,
                     int patience = 5, float threshold = 1e-4f, float minLr = 0.0f);

    // Returns true when the learning rate was reduced by this call
    bool step(float metric);

    float best() const { return m_best; }
    int badSteps() const { return m_badSteps; }

    void restore(float best, int badSteps) { m_best = best; m_badSteps = badSteps; }

private:
    bool isBetter(float metric) const;

    AdamOptimizer* m_optimizer;
    Mode m_mode;
    float m_factor;
    int m_patience;
    float m_threshold;
    float m_minLr;

    float m_best;
    int m_badSteps = 0;
};

#endif // ADAMOPTIMIZER_H
