#include <doctest/doctest.h>
#include "AdamOptimizer.h"

TEST_CASE("AdamOptimizer: FirstStepMovesByLearningRate") {
    AdamOptimizer adam(3, 0.01f);
    Eigen::VectorXf grad(3);
    grad << 4.0f, -0.5f, 0.0f;

    Eigen::VectorXf delta = adam.step(grad);

    // Bias correction makes the first update lr * sign(g)
    CHECK(delta(0) == doctest::Approx(0.01f).epsilon(1e-5f));
    CHECK(delta(1) == doctest::Approx(-0.01f).epsilon(1e-5f));
    CHECK(delta(2) == doctest::Approx(0.0f));
    CHECK(adam.timestep() == 1);
}

TEST_CASE("AdamOptimizer: ResetClearsMoments") {
    AdamOptimizer adam(2, 0.1f);
    adam.step(Eigen::VectorXf::Ones(2));
    adam.step(Eigen::VectorXf::Ones(2));
    REQUIRE(adam.timestep() == 2);

    adam.reset();
    CHECK(adam.timestep() == 0);
    CHECK(adam.firstMoment().norm() == doctest::Approx(0.0f));
    CHECK(adam.secondMoment().norm() == doctest::Approx(0.0f));
    CHECK(adam.learningRate() == doctest::Approx(0.1f));
}

TEST_CASE("AdamOptimizer: RestoreChecksSizes") {
    AdamOptimizer adam(4);
    CHECK_FALSE(adam.restore(3, 0.5f, Eigen::VectorXf::Zero(2), Eigen::VectorXf::Zero(4)));
    CHECK_FALSE(adam.restore(-1, 0.5f, Eigen::VectorXf::Zero(4), Eigen::VectorXf::Zero(4)));
    CHECK(adam.timestep() == 0);

    CHECK(adam.restore(3, 0.5f, Eigen::VectorXf::Ones(4), Eigen::VectorXf::Ones(4)));
    CHECK(adam.timestep() == 3);
    CHECK(adam.learningRate() == doctest::Approx(0.5f));
}

TEST_CASE("PlateauScheduler: HalvesAfterPatienceIsExceeded") {
    AdamOptimizer adam(1, 1e-3f);
    PlateauScheduler scheduler(&adam, PlateauScheduler::Mode::Max);

    CHECK_FALSE(scheduler.step(1.0f));
    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(scheduler.step(1.0f));
    }
    CHECK(scheduler.badSteps() == 5);
    CHECK(adam.learningRate() == doctest::Approx(1e-3f));

    CHECK(scheduler.step(0.9f));
    CHECK(adam.learningRate() == doctest::Approx(5e-4f));
    CHECK(scheduler.badSteps() == 0);
}

TEST_CASE("PlateauScheduler: ImprovementMustBeRelative") {
    AdamOptimizer adam(1, 1e-3f);
    PlateauScheduler scheduler(&adam, PlateauScheduler::Mode::Max);

    scheduler.step(100.0f);
    scheduler.step(100.005f);   // below 100 * (1 + 1e-4)
    CHECK(scheduler.badSteps() == 1);
    CHECK(scheduler.best() == doctest::Approx(100.0f));

    scheduler.step(100.5f);
    CHECK(scheduler.badSteps() == 0);
    CHECK(scheduler.best() == doctest::Approx(100.5f));
}

TEST_CASE("PlateauScheduler: MinModeTracksDecreasingLoss") {
    AdamOptimizer adam(1, 1e-3f);
    PlateauScheduler scheduler(&adam, PlateauScheduler::Mode::Min);

    scheduler.step(2.0f);
    scheduler.step(1.0f);
    CHECK(scheduler.best() == doctest::Approx(1.0f));
    CHECK(scheduler.badSteps() == 0);

    for (int i = 0; i < 6; ++i) scheduler.step(3.0f);
    CHECK(adam.learningRate() == doctest::Approx(5e-4f));
}

TEST_CASE("PlateauScheduler: RespectsMinimumRate") {
    AdamOptimizer adam(1, 1e-3f);
    PlateauScheduler scheduler(&adam, PlateauScheduler::Mode::Min, 0.5f, 0, 1e-4f, 8e-4f);

    scheduler.step(1.0f);
    CHECK(scheduler.step(1.0f));
    CHECK(adam.learningRate() == doctest::Approx(8e-4f));
    CHECK_FALSE(scheduler.step(1.0f));
}
