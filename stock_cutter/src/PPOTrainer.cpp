#include "PPOTrainer.h"
#include "ExperienceBuffer.h"
#include "PolicyNetwork.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

// Column-wise log-softmax of a (actions x batch) logit matrix
Eigen::MatrixXf logSoftmaxColumns(const Eigen::MatrixXf& logits) {
    Eigen::RowVectorXf maxes = logits.colwise().maxCoeff();
    Eigen::MatrixXf shifted = logits.rowwise() - maxes;
    Eigen::RowVectorXf logSum = shifted.array().exp().colwise().sum().log().matrix();
    return shifted.rowwise() - logSum;
}

} // namespace

PPOTrainer::PPOTrainer(ActorCriticNetwork* network, const PolicyConfig& config)
    : m_network(network)
    , m_config(config)
    , m_estimator(config.gamma, config.gae_lambda)
    , m_actorOptimizer(network->actorParamCount(), config.actor_lr)
    , m_criticOptimizer(network->criticParamCount(), config.critic_lr)
    , m_actorScheduler(&m_actorOptimizer, PlateauScheduler::Mode::Max,
                       config.lr_factor, config.lr_patience, config.lr_threshold)
    , m_criticScheduler(&m_criticOptimizer, PlateauScheduler::Mode::Min,
                        config.lr_factor, config.lr_patience, config.lr_threshold)
{
}

float PPOTrainer::clipGradientNorm(Eigen::VectorXf& grad, float maxNorm) {
    float norm = grad.norm();
    float coef = maxNorm / (norm + 1e-6f);
    if (coef < 1.0f) {
        grad *= coef;
    }
    return norm;
}

std::optional<UpdateStats> PPOTrainer::update(ExperienceBuffer& buffer) {
    buffer.dropPending();
    if (buffer.finalizedCount() == 0) {
        buffer.clear();
        return std::nullopt;
    }

    const std::vector<Experience>& records = buffer.records();
    const int n = static_cast<int>(records.size());
    const int stateDim = m_network->stateDim();

    Eigen::MatrixXf states(stateDim, n);
    std::vector<int> actions(n);
    Eigen::VectorXf rewards(n);
    Eigen::VectorXf oldValues(n);
    Eigen::VectorXf oldLogProbs(n);
    std::vector<bool> dones(n);

    for (int i = 0; i < n; ++i) {
        states.col(i) = records[i].state;
        actions[i] = records[i].action;
        rewards(i) = records[i].reward;
        oldValues(i) = records[i].value;
        oldLogProbs(i) = records[i].logProb;
        dones[i] = records[i].done;
    }

    AdvantageResult gae = m_estimator.compute(rewards, oldValues, dones);
    Eigen::VectorXf returns = AdvantageEstimator::standardize(gae.returns);
    Eigen::VectorXf advantages = AdvantageEstimator::standardize(gae.advantages);

    if (m_config.verbose) {
        std::cout << "Updating networks with " << n << " samples..." << std::endl;
    }

    UpdateStats stats;
    stats.samples = n;

    for (int epoch = 0; epoch < m_config.ppo_epochs; ++epoch) {
        stats.actorLoss = actorPass(states, actions, oldLogProbs, advantages,
                                    stats.entropy, stats.actorGradNorm);
        stats.criticLoss = criticPass(states, oldValues, returns, stats.criticGradNorm);
    }

    stats.meanReward = rewards.mean();
    if (m_actorScheduler.step(stats.meanReward) && m_config.verbose) {
        std::cout << "  Actor learning rate reduced to " << m_actorOptimizer.learningRate() << std::endl;
    }
    if (m_criticScheduler.step(stats.criticLoss) && m_config.verbose) {
        std::cout << "  Critic learning rate reduced to " << m_criticOptimizer.learningRate() << std::endl;
    }
    stats.actorLr = m_actorOptimizer.learningRate();
    stats.criticLr = m_criticOptimizer.learningRate();

    if (m_config.verbose) {
        std::cout << "  Losses - Actor: " << stats.actorLoss
                  << ", Critic: " << stats.criticLoss
                  << ", Entropy: " << stats.entropy << std::endl;
    }

    buffer.clear();
    ++m_updates;
    return stats;
}

float PPOTrainer::actorPass(const Eigen::MatrixXf& states, const std::vector<int>& actions,
                            const Eigen::VectorXf& oldLogProbs, const Eigen::VectorXf& advantages,
                            float& entropy, float& gradNorm) {
    DenseNetwork& actor = m_network->actor();
    const int n = static_cast<int>(states.cols());
    const float invN = 1.0f / static_cast<float>(n);
    const float eps = m_config.clip_epsilon;

    Eigen::MatrixXf logProbs = logSoftmaxColumns(actor.forwardTraining(states));
    Eigen::MatrixXf probs = logProbs.array().exp().matrix();

    Eigen::MatrixXf logitGrad = Eigen::MatrixXf::Zero(logProbs.rows(), n);
    float surrogate = 0.0f;
    float entropySum = 0.0f;

    for (int i = 0; i < n; ++i) {
        const int a = actions[i];
        float ratio = std::exp(logProbs(a, i) - oldLogProbs(i));
        float surr1 = ratio * advantages(i);
        float surr2 = std::clamp(ratio, 1.0f - eps, 1.0f + eps) * advantages(i);
        surrogate += std::min(surr1, surr2);

        // d(-min(surr1, surr2)) / d logp_a; zero once the clipped branch is active
        float coef = (surr1 <= surr2) ? -advantages(i) * ratio * invN : 0.0f;
        if (coef != 0.0f) {
            logitGrad.col(i) = -coef * probs.col(i);
            logitGrad(a, i) += coef;
        }

        // -entropy_coef * H / n, with dH/dz_k = -p_k (log p_k + H)
        float h = -(probs.col(i).array() * logProbs.col(i).array()).sum();
        entropySum += h;
        logitGrad.col(i) += (m_config.entropy_coef * invN) *
            (probs.col(i).array() * (logProbs.col(i).array() + h)).matrix();
    }

    entropy = entropySum * invN;

    actor.backward(logitGrad);
    Eigen::VectorXf grad = actor.getGradients();
    gradNorm = clipGradientNorm(grad, m_config.max_grad_norm);
    actor.setParameters(actor.getParameters() - m_actorOptimizer.step(grad));

    return -surrogate * invN;
}

float PPOTrainer::criticPass(const Eigen::MatrixXf& states, const Eigen::VectorXf& oldValues,
                             const Eigen::VectorXf& returns, float& gradNorm) {
    DenseNetwork& critic = m_network->critic();
    const int n = static_cast<int>(states.cols());
    const float invN = 1.0f / static_cast<float>(n);
    const float eps = m_config.clip_epsilon;

    Eigen::VectorXf values = critic.forwardTraining(states).row(0).transpose();

    Eigen::MatrixXf valueGrad(1, n);
    float valueLoss = 0.0f;

    for (int i = 0; i < n; ++i) {
        float diff = values(i) - oldValues(i);
        float clipped = oldValues(i) + std::clamp(diff, -eps, eps);
        float loss1 = (values(i) - returns(i)) * (values(i) - returns(i));
        float loss2 = (clipped - returns(i)) * (clipped - returns(i));

        if (loss1 >= loss2) {
            valueLoss += loss1;
            valueGrad(0, i) = m_config.value_coef * invN * 2.0f * (values(i) - returns(i));
        } else {
            valueLoss += loss2;
            bool insideClip = diff > -eps && diff < eps;
            valueGrad(0, i) = insideClip ? m_config.value_coef * invN * 2.0f * (clipped - returns(i)) : 0.0f;
        }
    }

    float l2 = critic.parameterSquaredNorm();
    float loss = m_config.value_coef * valueLoss * invN + m_config.critic_l2 * l2;

    critic.backward(valueGrad);
    Eigen::VectorXf params = critic.getParameters();
    Eigen::VectorXf grad = critic.getGradients() + 2.0f * m_config.critic_l2 * params;
    gradNorm = clipGradientNorm(grad, m_config.max_grad_norm);
    critic.setParameters(params - m_criticOptimizer.step(grad));

    return loss;
}
