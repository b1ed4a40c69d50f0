#include "PackingPolicy.h"
#include "Checkpoint.h"
#include <iostream>
#include <stdexcept>
#include <string>

PackingPolicy::PackingPolicy(const PolicyConfig& config)
    : m_config(config)
    , m_sampler(config)
    , m_rng(config.seed)
{
    m_config.validate();
}

PackingPolicy::~PackingPolicy() = default;

void PackingPolicy::requireInitialized(const char* operation) const {
    if (!isInitialized()) {
        throw std::logic_error(std::string("PackingPolicy::") + operation + " called before initialize()");
    }
}

ActorCriticNetwork& PackingPolicy::network() {
    requireInitialized("network");
    return *m_network;
}

PPOTrainer& PackingPolicy::trainer() {
    requireInitialized("trainer");
    return *m_trainer;
}

void PackingPolicy::initialize(const Observation& firstObservation) {
    if (isInitialized()) return;

    m_encoder.initialize(firstObservation);
    const int dim = m_encoder.dimension();

    m_normalizer.reset(dim);
    m_network = std::make_unique<ActorCriticNetwork>(dim, ActionSpace::kActionCount, m_config.seed);
    m_trainer = std::make_unique<PPOTrainer>(m_network.get(), m_config);
    m_initialDemand = remainingDemand(firstObservation);

    if (m_config.verbose) {
        std::cout << "Policy initialized: state dim " << dim
                  << ", " << m_encoder.productSlots() << " product slots"
                  << ", initial demand " << m_initialDemand << std::endl;
    }
}

void PackingPolicy::advancePhase(int remaining) {
    if (m_phase != PolicyPhase::Exploring) return;

    bool warmedUp = m_steps >= m_config.warmup_steps;
    bool demandDropped = remaining <= m_config.exploit_demand_fraction * static_cast<float>(m_initialDemand);
    if (warmedUp && demandDropped) {
        m_phase = PolicyPhase::Exploiting;
        if (m_config.verbose) {
            std::cout << "Switching to learned placement at step " << m_steps << std::endl;
        }
    }
}

PolicyDecision PackingPolicy::decide(const Observation& obs, const StepInfo& info) {
    requireInitialized("decide");

    PolicyDecision decision;
    advancePhase(remainingDemand(obs));

    if (m_phase == PolicyPhase::Exploring) {
        decision.placement = placement::structuredPlacement(obs);
        if (decision.placement) decision.source = DecisionSource::Structured;
    }

    if (!decision.placement) {
        decision.placement = learnedPlacement(obs, info, decision);
    }

    if (!decision.placement) {
        GreedySearchResult greedy = placement::greedyPlacement(obs, m_config.greedy_budget,
                                                               m_config.greedy_rotation_bonus);
        decision.placement = greedy.placement;
        decision.source = greedy.placement ? DecisionSource::Greedy : DecisionSource::None;
    }

    ++m_steps;
    m_lastObservation = obs;
    m_lastDecision = decision.placement;
    return decision;
}

Decision PackingPolicy::learnedPlacement(const Observation& obs, const StepInfo& info, PolicyDecision& decision) {
    if (!placement::largestProductIndex(obs)) return std::nullopt;

    std::optional<int> preferredStock = placement::findBestFittingStock(obs);
    if (!preferredStock) return std::nullopt;

    Eigen::VectorXf raw = m_encoder.encode(obs, info, m_steps);
    Eigen::VectorXf state = m_normalizer.normalize(raw);
    m_normalizer.update(raw);

    Eigen::VectorXf logits = m_network->actorForward(state);
    SampledAction sampled = m_sampler.sample(logits, *preferredStock, m_steps, m_rng);
    decision.action = sampled.action;

    if (m_training) {
        float value = m_network->criticForward(state);
        m_buffer.beginStep(state, sampled.action, value, sampled.logProb);
    }

    DecodedAction decoded = placement::decodeAction(sampled.action, static_cast<int>(obs.stocks.size()));
    Decision result = placement::realizeDecodedAction(obs, decoded, m_config.decode_rotation_bonus);
    if (result) {
        decision.source = DecisionSource::Learned;
        return result;
    }

    result = placement::randomValidPlacement(obs, m_config.random_trials, m_rng);
    if (result) decision.source = DecisionSource::RandomFallback;
    return result;
}

std::optional<float> PackingPolicy::reportOutcome(const Observation& next, const StepInfo& info, bool terminal) {
    requireInitialized("reportOutcome");
    if (!m_lastObservation) return std::nullopt;

    RewardBreakdown breakdown = m_shaper.evaluate(m_lastDecision, *m_lastObservation, next);
    const float reward = breakdown.total();
    m_lastReward = breakdown;
    m_episodeReward += reward;

    if (m_lastDecision && m_lastDecision->stockIndex < static_cast<int>(next.stocks.size())) {
        m_metrics.evaluatePlacement(next.stocks[m_lastDecision->stockIndex], *m_lastDecision);
    } else {
        m_metrics.recordInvalidAction();
    }
    m_metrics.recordStep(info.filledRatio, reward);
    m_metrics.correctLastFilledRatio(correctedFilledRatio(next));

    if (m_training && m_buffer.finalizePending(reward, terminal) &&
        m_buffer.finalizedCount() >= m_config.update_trigger) {
        std::optional<UpdateStats> stats = m_trainer->update(m_buffer);
        if (stats) m_lastUpdate = stats;
    }

    m_lastObservation.reset();
    m_lastDecision.reset();
    return reward;
}

void PackingPolicy::beginEpisode() {
    m_episodeReward = 0.0f;
    m_lastObservation.reset();
    m_lastDecision.reset();
    m_buffer.dropPending();
}

bool PackingPolicy::endEpisode(const Observation& finalObs) {
    return m_metrics.logEpisodeSummary(finalObs, correctedFilledRatio(finalObs), m_episodeReward);
}

void PackingPolicy::setTraining(bool training) {
    m_training = training;
    if (!training) m_buffer.dropPending();
}

bool PackingPolicy::save(const std::string& path) const {
    if (!isInitialized()) {
        std::cerr << "Cannot save an uninitialized policy" << std::endl;
        return false;
    }

    CheckpointData data;
    data.stateDim = m_network->stateDim();
    data.actionDim = m_network->actionDim();
    data.productSlots = m_encoder.productSlots();
    data.initialDemand = m_initialDemand;
    data.steps = m_steps;
    data.exploiting = m_phase == PolicyPhase::Exploiting;
    data.actorParams = m_network->getActorParams();
    data.criticParams = m_network->getCriticParams();

    const AdamOptimizer& actorOpt = m_trainer->actorOptimizer();
    const AdamOptimizer& criticOpt = m_trainer->criticOptimizer();
    data.actorOptimizer = {actorOpt.timestep(), actorOpt.learningRate(), actorOpt.firstMoment(), actorOpt.secondMoment()};
    data.criticOptimizer = {criticOpt.timestep(), criticOpt.learningRate(), criticOpt.firstMoment(), criticOpt.secondMoment()};
    data.actorScheduler = {m_trainer->actorScheduler().best(), m_trainer->actorScheduler().badSteps()};
    data.criticScheduler = {m_trainer->criticScheduler().best(), m_trainer->criticScheduler().badSteps()};
    data.normalizerMean = m_normalizer.mean();
    data.normalizerStd = m_normalizer.stddev();

    if (!checkpoint::write(path, data)) {
        std::cerr << "Failed to save checkpoint " << checkpoint::withExtension(path) << std::endl;
        return false;
    }
    if (m_config.verbose) {
        std::cout << "Saved checkpoint " << checkpoint::withExtension(path) << std::endl;
    }
    return true;
}

bool PackingPolicy::load(const std::string& path) {
    const std::string fullPath = checkpoint::withExtension(path);
    auto fail = [&](const char* reason) {
        std::cerr << "Failed to load checkpoint " << fullPath << ": " << reason << std::endl;
        return false;
    };

    std::optional<CheckpointData> data = checkpoint::read(path);
    if (!data) return fail("unreadable or not a checkpoint");

    if (data->actionDim != ActionSpace::kActionCount) return fail("action space mismatch");
    if (data->productSlots < 0 || data->stateDim != StateEncoder::dimensionFor(data->productSlots)) {
        return fail("inconsistent state dimension");
    }
    if (isInitialized() && data->stateDim != m_encoder.dimension()) return fail("state dimension mismatch");

    // Everything is staged in temporaries and committed only once it all validated
    auto network = std::make_unique<ActorCriticNetwork>(data->stateDim, data->actionDim, m_config.seed);
    if (data->actorParams.size() != network->actorParamCount() ||
        data->criticParams.size() != network->criticParamCount()) {
        return fail("parameter count mismatch");
    }
    network->setActorParams(data->actorParams);
    network->setCriticParams(data->criticParams);

    auto trainer = std::make_unique<PPOTrainer>(network.get(), m_config);
    const OptimizerState& a = data->actorOptimizer;
    const OptimizerState& c = data->criticOptimizer;
    if (!trainer->actorOptimizer().restore(a.timestep, a.learningRate, a.firstMoment, a.secondMoment) ||
        !trainer->criticOptimizer().restore(c.timestep, c.learningRate, c.firstMoment, c.secondMoment)) {
        return fail("optimizer state mismatch");
    }
    trainer->actorScheduler().restore(data->actorScheduler.best, data->actorScheduler.badSteps);
    trainer->criticScheduler().restore(data->criticScheduler.best, data->criticScheduler.badSteps);

    RunningNormalizer normalizer(data->stateDim);
    if (!normalizer.restore(data->normalizerMean, data->normalizerStd)) {
        return fail("normalizer size mismatch");
    }

    if (!m_encoder.isInitialized()) {
        Observation shape;
        shape.products.resize(data->productSlots);
        m_encoder.initialize(shape);
    }
    m_network = std::move(network);
    m_trainer = std::move(trainer);
    m_normalizer = normalizer;
    m_initialDemand = data->initialDemand;
    m_steps = static_cast<long>(data->steps);
    m_phase = data->exploiting ? PolicyPhase::Exploiting : PolicyPhase::Exploring;
    m_buffer.clear();
    m_lastObservation.reset();
    m_lastDecision.reset();

    if (m_config.verbose) {
        std::cout << "Loaded checkpoint " << fullPath << " (step " << m_steps << ")" << std::endl;
    }
    return true;
}
