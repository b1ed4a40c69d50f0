#ifndef PACKINGPOLICY_H
#define PACKINGPOLICY_H

#include "ActionSampler.h"
#include "CuttingTypes.h"
#include "ExperienceBuffer.h"
#include "PPOTrainer.h"
#include "PlacementStrategies.h"
#include "PolicyConfig.h"
#include "PolicyNetwork.h"
#include "RewardShaper.h"
#include "StateEncoder.h"
#include "TrainingMetrics.h"
#include <memory>
#include <optional>
#include <random>
#include <string>

enum class PolicyPhase {
    Exploring,   // structured placement first
    Exploiting   // learned decoder, then greedy
};

struct PolicyDecision {
    Decision placement;
    DecisionSource source = DecisionSource::None;
    std::optional<int> action;   // sampled action index, learned path only
};

/**
 * @brief Trainable placement policy for 2D cutting stock
 *
 * Owns every piece of mutable state: encoder dimensions, state normalizer,
 * actor/critic networks, optimizers, experience buffer and metrics.
 *
 * Lifecycle:
 * 1. initialize() with the first observation (fixes dimensions, idempotent)
 * 2. decide() for every step, then reportOutcome() once it was applied
 * 3. save() / load() at any time after initialize()
 *
 * decide() and reportOutcome() throw std::logic_error before initialize().
 * Once the step counter reaches warmup_steps and remaining demand has dropped
 * to exploit_demand_fraction of the initial demand, the policy switches to
 * the exploiting phase for good.
 */
class PackingPolicy {
public:
    explicit PackingPolicy(const PolicyConfig& config = PolicyConfig{});
    ~PackingPolicy();

    void initialize(const Observation& firstObservation);
    bool isInitialized() const { return m_network != nullptr; }

    PolicyDecision decide(const Observation& obs, const StepInfo& info);

    /**
     * @brief Close out the last decision with the observation that followed it
     *
     * Computes the shaped reward, finalizes the pending experience and runs
     * a PPO update once update_trigger experiences are buffered. Returns
     * std::nullopt if there is no decision awaiting an outcome.
     */
    std::optional<float> reportOutcome(const Observation& next, const StepInfo& info, bool terminal);

    void beginEpisode();

    // Records the episode in the metrics if all demand was met; returns whether it was recorded
    bool endEpisode(const Observation& finalObs);

    void setTraining(bool training);
    bool isTraining() const { return m_training; }

    // Checkpoint I/O; false leaves the in-memory state unchanged
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    long steps() const { return m_steps; }
    PolicyPhase phase() const { return m_phase; }
    int initialDemand() const { return m_initialDemand; }
    float episodeReward() const { return m_episodeReward; }

    const PolicyConfig& config() const { return m_config; }
    const StateEncoder& encoder() const { return m_encoder; }
    const RunningNormalizer& normalizer() const { return m_normalizer; }
    const ExperienceBuffer& buffer() const { return m_buffer; }
    const TrainingMetrics& metrics() const { return m_metrics; }
    const std::optional<RewardBreakdown>& lastReward() const { return m_lastReward; }
    const std::optional<UpdateStats>& lastUpdate() const { return m_lastUpdate; }

    // Valid after initialize()
    ActorCriticNetwork& network();
    PPOTrainer& trainer();

private:
    void requireInitialized(const char* operation) const;
    void advancePhase(int remaining);
    Decision learnedPlacement(const Observation& obs, const StepInfo& info, PolicyDecision& decision);

    PolicyConfig m_config;

    StateEncoder m_encoder;
    RunningNormalizer m_normalizer;
    std::unique_ptr<ActorCriticNetwork> m_network;
    std::unique_ptr<PPOTrainer> m_trainer;
    ActionSampler m_sampler;
    RewardShaper m_shaper;
    ExperienceBuffer m_buffer;
    TrainingMetrics m_metrics;
    std::mt19937 m_rng;

    bool m_training = true;
    long m_steps = 0;
    int m_initialDemand = 0;
    PolicyPhase m_phase = PolicyPhase::Exploring;

    // Decision awaiting reportOutcome()
    std::optional<Observation> m_lastObservation;
    Decision m_lastDecision;

    float m_episodeReward = 0.0f;
    std::optional<RewardBreakdown> m_lastReward;
    std::optional<UpdateStats> m_lastUpdate;
};

#endif // PACKINGPOLICY_H
