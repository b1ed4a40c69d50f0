#ifndef PPOTRAINER_H
#define PPOTRAINER_H

#include "AdamOptimizer.h"
#include "AdvantageEstimator.h"
#include "PolicyConfig.h"
#include <Eigen/Core>
#include <optional>
#include <vector>

class ActorCriticNetwork;
class ExperienceBuffer;

struct UpdateStats {
    int samples = 0;
    float actorLoss = 0.0f;    // last pass
    float criticLoss = 0.0f;   // last pass, includes the L2 term
    float entropy = 0.0f;      // last pass, mean over samples
    float meanReward = 0.0f;
    float actorGradNorm = 0.0f;
    float criticGradNorm = 0.0f;
    float actorLr = 0.0f;
    float criticLr = 0.0f;
};

/**
 * @brief Clipped-surrogate PPO update over a whole experience buffer
 *
 * Every update runs ppo_epochs full-batch passes (no shuffling or
 * mini-batches). Actor and critic have separate Adam optimizers and
 * separate global-norm clipping. After the passes the actor learning rate
 * follows the mean raw reward (maximize) and the critic learning rate
 * follows the final critic loss (minimize).
 */
class PPOTrainer {
public:
    PPOTrainer(ActorCriticNetwork* network, const PolicyConfig& config);
    PPOTrainer(const PPOTrainer&) = delete;
    PPOTrainer& operator=(const PPOTrainer&) = delete;

    /**
     * @brief Drain the buffer into one PPO update
     *
     * A pending (unfinalized) record is discarded. The buffer is empty on
     * return. Returns std::nullopt, computing nothing, when there was no
     * finalized record.
     */
    std::optional<UpdateStats> update(ExperienceBuffer& buffer);

    AdamOptimizer& actorOptimizer() { return m_actorOptimizer; }
    AdamOptimizer& criticOptimizer() { return m_criticOptimizer; }
    const AdamOptimizer& actorOptimizer() const { return m_actorOptimizer; }
    const AdamOptimizer& criticOptimizer() const { return m_criticOptimizer; }

    PlateauScheduler& actorScheduler() { return m_actorScheduler; }
    PlateauScheduler& criticScheduler() { return m_criticScheduler; }
    const PlateauScheduler& actorScheduler() const { return m_actorScheduler; }
    const PlateauScheduler& criticScheduler() const { return m_criticScheduler; }

    int updateCount() const { return m_updates; }

    // Scales grad in place so its L2 norm is at most maxNorm; returns the norm before clipping
    static float clipGradientNorm(Eigen::VectorXf& grad, float maxNorm);

private:
    float actorPass(const Eigen::MatrixXf& states, const std::vector<int>& actions,
                    const Eigen::VectorXf& oldLogProbs, const Eigen::VectorXf& advantages,
                    float& entropy, float& gradNorm);
    float criticPass(const Eigen::MatrixXf& states, const Eigen::VectorXf& oldValues,
                     const Eigen::VectorXf& returns, float& gradNorm);

    ActorCriticNetwork* m_network;
    PolicyConfig m_config;
    AdvantageEstimator m_estimator;

    AdamOptimizer m_actorOptimizer;
    AdamOptimizer m_criticOptimizer;
    PlateauScheduler m_actorScheduler;
    PlateauScheduler m_criticScheduler;

    int m_updates = 0;
};

#endif // PPOTRAINER_H
