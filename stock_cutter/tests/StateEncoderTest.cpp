#include <doctest/doctest.h>
#include <stdexcept>
#include "StateEncoder.h"
#include "TestHelpers.h"

using namespace testing_helpers;

namespace {

Observation threeProductObservation() {
    return makeObservation({stockWithBlock(10, 20, 0, 0, 5, 4), makeEmptyStock(15, 12)},
                           {{2, 3, 4}, {1, 1, 0}, {6, 2, 14}});
}

} // namespace

TEST_CASE("StateEncoder: ThrowsBeforeInitialize") {
    StateEncoder encoder;
    CHECK_FALSE(encoder.isInitialized());
    CHECK_THROWS_AS(encoder.dimension(), std::logic_error);
    CHECK_THROWS_AS(encoder.encode(threeProductObservation(), StepInfo{}, 0), std::logic_error);
}

TEST_CASE("StateEncoder: DimensionIsFixedByFirstObservation") {
    StateEncoder encoder;
    encoder.initialize(threeProductObservation());

    CHECK(encoder.productSlots() == 3);
    CHECK(encoder.dimension() == 311);

    // Later observations do not change the slot count
    encoder.initialize(makeObservation({makeEmptyStock(5, 5)}, {{1, 1, 1}}));
    CHECK(encoder.dimension() == 311);
}

TEST_CASE("StateEncoder: EncodesStocksProductsAndGlobals") {
    StateEncoder encoder;
    Observation obs = threeProductObservation();
    encoder.initialize(obs);

    Eigen::VectorXf state = encoder.encode(obs, StepInfo{0.5f}, 250);
    REQUIRE(state.size() == 311);

    CHECK(state(0) == doctest::Approx(1.0f));
    CHECK(state(1) == doctest::Approx(2.0f));
    CHECK(state(2) == doctest::Approx(0.1f));
    CHECK(state(3) == doctest::Approx(1.5f));
    CHECK(state(4) == doctest::Approx(1.2f));
    CHECK(state(5) == doctest::Approx(0.0f));
    CHECK(state(6) == doctest::Approx(0.0f));   // unused stock slot

    // The zero-quantity product is skipped, the rest are packed from the front
    CHECK(state(300) == doctest::Approx(0.2f));
    CHECK(state(301) == doctest::Approx(0.3f));
    CHECK(state(302) == doctest::Approx(0.4f));
    CHECK(state(303) == doctest::Approx(0.6f));
    CHECK(state(304) == doctest::Approx(0.2f));
    CHECK(state(305) == doctest::Approx(1.0f));  // quantity capped at 10
    CHECK(state(306) == doctest::Approx(0.0f));
    CHECK(state(308) == doctest::Approx(0.0f));

    CHECK(state(309) == doctest::Approx(0.5f));
    CHECK(state(310) == doctest::Approx(0.25f));
}

TEST_CASE("StateEncoder: TruncatesExtraProductsAndStocks") {
    StateEncoder encoder;
    encoder.initialize(makeObservation({makeEmptyStock(5, 5)}, {{1, 1, 1}}));

    std::vector<StockGrid> stocks(120, makeEmptyStock(7, 7));
    Observation larger = makeObservation(stocks, {{2, 2, 1}, {3, 3, 1}});

    Eigen::VectorXf state = encoder.encode(larger, StepInfo{}, 0);
    REQUIRE(state.size() == StateEncoder::dimensionFor(1));
    CHECK(state(297) == doctest::Approx(0.7f));
    CHECK(state(300) == doctest::Approx(0.2f));
    CHECK(state(303) == doctest::Approx(0.0f));  // first global feature, not the second product
}

TEST_CASE("RunningNormalizer: StartsAsIdentity") {
    RunningNormalizer normalizer(3);
    Eigen::VectorXf x(3);
    x << 1.0f, -2.0f, 0.5f;

    CHECK(normalizer.normalize(x).isApprox(x, 1e-6f));
}

TEST_CASE("RunningNormalizer: UpdateBlendsVectorStatistics") {
    RunningNormalizer normalizer(3);
    Eigen::VectorXf x(3);
    x << 1.0f, 2.0f, 3.0f;

    normalizer.update(x);

    // Vector mean 2 and sample std 1, blended with weight 0.01
    for (int i = 0; i < 3; ++i) {
        CHECK(normalizer.mean()(i) == doctest::Approx(0.02f).epsilon(1e-5f));
        CHECK(normalizer.stddev()(i) == doctest::Approx(1.0f).epsilon(1e-5f));
    }

    Eigen::VectorXf normalized = normalizer.normalize(x);
    CHECK(normalized(0) == doctest::Approx(0.98f).epsilon(1e-5f));
}

TEST_CASE("RunningNormalizer: RestoreRejectsWrongSize") {
    RunningNormalizer normalizer(4);
    CHECK_FALSE(normalizer.restore(Eigen::VectorXf::Zero(3), Eigen::VectorXf::Ones(3)));
    CHECK(normalizer.restore(Eigen::VectorXf::Constant(4, 0.5f), Eigen::VectorXf::Constant(4, 2.0f)));
    CHECK(normalizer.mean()(3) == doctest::Approx(0.5f));
    CHECK(normalizer.stddev()(0) == doctest::Approx(2.0f));
}
