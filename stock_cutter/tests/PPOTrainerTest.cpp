#include <doctest/doctest.h>
#include <cmath>
#include "ActionSampler.h"
#include "ExperienceBuffer.h"
#include "PPOTrainer.h"
#include "PolicyNetwork.h"

namespace {

PolicyConfig quietConfig() {
    PolicyConfig config;
    config.verbose = false;
    return config;
}

Eigen::VectorXf fixedState(int dim) {
    Eigen::VectorXf s(dim);
    for (int i = 0; i < dim; ++i) s(i) = std::sin(0.7f * static_cast<float>(i + 1));
    return s;
}

// One-step episodes on the same state: action 0 pays +1, action 1 pays -1
void fillContrastingEpisodes(ExperienceBuffer& buffer, const ActorCriticNetwork& net, int pairs) {
    Eigen::VectorXf state = fixedState(net.stateDim());
    Eigen::VectorXf logProbs = ActionSampler::logSoftmax(net.actorForward(state));
    float value = net.criticForward(state);

    for (int i = 0; i < pairs; ++i) {
        buffer.beginStep(state, 0, value, logProbs(0));
        buffer.finalizePending(1.0f, true);
        buffer.beginStep(state, 1, value, logProbs(1));
        buffer.finalizePending(-1.0f, true);
    }
}

} // namespace

TEST_CASE("PPOTrainer: EmptyBufferIsNoOp") {
    ActorCriticNetwork net(8, 4, 1);
    PPOTrainer trainer(&net, quietConfig());
    ExperienceBuffer buffer;

    Eigen::VectorXf before = net.getActorParams();
    CHECK_FALSE(trainer.update(buffer).has_value());
    CHECK(net.getActorParams().isApprox(before));
    CHECK(trainer.updateCount() == 0);
}

TEST_CASE("PPOTrainer: PendingOnlyBufferIsNoOp") {
    ActorCriticNetwork net(8, 4, 1);
    PPOTrainer trainer(&net, quietConfig());
    ExperienceBuffer buffer;
    buffer.beginStep(fixedState(8), 0, 0.0f, -1.0f);

    CHECK_FALSE(trainer.update(buffer).has_value());
    CHECK(buffer.empty());
}

TEST_CASE("PPOTrainer: UpdateDrainsBufferAndRunsEveryEpoch") {
    ActorCriticNetwork net(8, 4, 2);
    PolicyConfig config = quietConfig();
    PPOTrainer trainer(&net, config);
    ExperienceBuffer buffer;

    fillContrastingEpisodes(buffer, net, 3);
    buffer.beginStep(fixedState(8), 2, 0.0f, -1.0f);   // never reported

    std::optional<UpdateStats> stats = trainer.update(buffer);
    REQUIRE(stats.has_value());
    CHECK(stats->samples == 6);
    CHECK(stats->meanReward == doctest::Approx(0.0f));
    CHECK(std::isfinite(stats->actorLoss));
    CHECK(std::isfinite(stats->criticLoss));
    CHECK(stats->entropy > 0.0f);

    CHECK(buffer.empty());
    CHECK(trainer.actorOptimizer().timestep() == config.ppo_epochs);
    CHECK(trainer.criticOptimizer().timestep() == config.ppo_epochs);
    CHECK(trainer.updateCount() == 1);

    CHECK_FALSE(trainer.update(buffer).has_value());
    CHECK(trainer.updateCount() == 1);
}

TEST_CASE("PPOTrainer: PositiveAdvantageActionGainsProbability") {
    ActorCriticNetwork net(8, 4, 3);
    PolicyConfig config = quietConfig();
    config.actor_lr = 1e-2f;
    PPOTrainer trainer(&net, config);
    ExperienceBuffer buffer;

    Eigen::VectorXf state = fixedState(8);
    Eigen::VectorXf before = ActionSampler::logSoftmax(net.actorForward(state));

    fillContrastingEpisodes(buffer, net, 4);
    REQUIRE(trainer.update(buffer).has_value());

    Eigen::VectorXf after = ActionSampler::logSoftmax(net.actorForward(state));
    CHECK(after(0) - after(1) > before(0) - before(1));
}

TEST_CASE("PPOTrainer: ClipGradientNorm") {
    Eigen::VectorXf grad(2);
    grad << 3.0f, 4.0f;

    float norm = PPOTrainer::clipGradientNorm(grad, 0.5f);
    CHECK(norm == doctest::Approx(5.0f));
    CHECK(grad.norm() == doctest::Approx(0.5f).epsilon(1e-5f));

    Eigen::VectorXf small(2);
    small << 0.01f, 0.0f;
    PPOTrainer::clipGradientNorm(small, 0.5f);
    CHECK(small(0) == doctest::Approx(0.01f));
}
