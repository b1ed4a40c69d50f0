#include <doctest/doctest.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "PolicyNetwork.h"

namespace {

Eigen::MatrixXf randomMatrix(int rows, int cols, uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    Eigen::MatrixXf m(rows, cols);
    for (int i = 0; i < m.size(); ++i) m.data()[i] = dist(gen);
    return m;
}

} // namespace

TEST_CASE("PolicyNetwork: ActorAndCriticShapes") {
    ActorCriticNetwork net(20, 50, 7);

    CHECK(net.stateDim() == 20);
    CHECK(net.actionDim() == 50);

    Eigen::VectorXf state = randomMatrix(20, 1, 1).col(0);
    CHECK(net.actorForward(state).size() == 50);
    CHECK(std::isfinite(net.criticForward(state)));

    Eigen::MatrixXf batch = randomMatrix(20, 4, 2);
    Eigen::MatrixXf logits = net.actorForward(batch);
    REQUIRE(logits.rows() == 50);
    REQUIRE(logits.cols() == 4);
    CHECK(net.criticForward(batch).size() == 4);
}

TEST_CASE("PolicyNetwork: BatchColumnsMatchSingleCalls") {
    ActorCriticNetwork net(12, 8, 3);
    Eigen::MatrixXf batch = randomMatrix(12, 3, 4);

    Eigen::MatrixXf logits = net.actorForward(batch);
    Eigen::VectorXf values = net.criticForward(batch);
    for (int c = 0; c < 3; ++c) {
        Eigen::VectorXf state = batch.col(c);
        CHECK(net.actorForward(state).isApprox(logits.col(c), 1e-4f));
        CHECK(net.criticForward(state) == doctest::Approx(values(c)).epsilon(1e-4f));
    }
}

TEST_CASE("PolicyNetwork: SameSeedSameParameters") {
    ActorCriticNetwork a(10, 6, 11);
    ActorCriticNetwork b(10, 6, 11);
    ActorCriticNetwork c(10, 6, 12);

    CHECK(a.getActorParams().isApprox(b.getActorParams()));
    CHECK_FALSE(a.getActorParams().isApprox(c.getActorParams()));
}

TEST_CASE("PolicyNetwork: ParameterRoundTripAndSizeCheck") {
    ActorCriticNetwork source(10, 6, 1);
    ActorCriticNetwork target(10, 6, 2);

    CHECK(source.getActorParams().size() == source.actorParamCount());
    CHECK(source.getCriticParams().size() == source.criticParamCount());

    target.setActorParams(source.getActorParams());
    target.setCriticParams(source.getCriticParams());

    Eigen::VectorXf state = randomMatrix(10, 1, 5).col(0);
    CHECK(target.actorForward(state).isApprox(source.actorForward(state)));
    CHECK(target.criticForward(state) == doctest::Approx(source.criticForward(state)));

    CHECK_THROWS_AS(target.setActorParams(Eigen::VectorXf::Zero(3)), std::invalid_argument);
}

TEST_CASE("PolicyNetwork: CriticStartsWithZeroBiases") {
    ActorCriticNetwork net(5, 4, 0);
    // Last critic layer: 32 weights and 1 bias at the very end of the flat vector
    Eigen::VectorXf params = net.getCriticParams();
    CHECK(params(params.size() - 1) == doctest::Approx(0.0f));
}

TEST_CASE("DenseNetwork: BackwardMatchesFiniteDifferences") {
    DenseNetwork net(4, {{6, true, true, 1.0f}, {3, false, false, 1.0f}}, false, 9);
    Eigen::MatrixXf input = randomMatrix(4, 2, 10);
    Eigen::MatrixXf weights = randomMatrix(3, 2, 11);

    auto loss = [&](const DenseNetwork& n) {
        return (n.forward(input).array() * weights.array()).sum();
    };

    net.forwardTraining(input);
    net.backward(weights);
    Eigen::VectorXf analytic = net.getGradients();
    REQUIRE(analytic.size() == net.parameterCount());

    Eigen::VectorXf params = net.getParameters();
    const float h = 1e-3f;
    for (int i = 0; i < params.size(); ++i) {
        Eigen::VectorXf plus = params;
        Eigen::VectorXf minus = params;
        plus(i) += h;
        minus(i) -= h;

        net.setParameters(plus);
        float lp = loss(net);
        net.setParameters(minus);
        float lm = loss(net);

        float numeric = (lp - lm) / (2.0f * h);
        INFO("parameter ", i);
        CHECK(std::abs(analytic(i) - numeric) <= 5e-2f * std::max(1.0f, std::abs(numeric)));
    }
}

TEST_CASE("DenseNetwork: SquaredNormSumsAllParameters") {
    DenseNetwork net(3, {{2, false, false, 1.0f}}, false, 4);
    CHECK(net.parameterSquaredNorm() == doctest::Approx(net.getParameters().squaredNorm()).epsilon(1e-5f));
}
