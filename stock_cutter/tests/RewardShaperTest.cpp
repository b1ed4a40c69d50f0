#include <doctest/doctest.h>
#include "RewardShaper.h"
#include "TestHelpers.h"

using namespace testing_helpers;

namespace {

float sumOfTerms(const RewardBreakdown& r) {
    return r.scatter + r.adjacency + r.topDown + r.cornerEdge + r.newStock + r.utilization + r.isolation;
}

} // namespace

TEST_CASE("RewardShaper: FirstPieceInCornerOfFreshStock") {
    Observation before = makeObservation({makeEmptyStock(10, 10)}, {{4, 4, 1}});
    Observation after = makeObservation({stockWithBlock(10, 10, 0, 0, 4, 4)}, {{4, 4, 0}});

    RewardShaper shaper;
    RewardBreakdown r = shaper.evaluate(Placement{0, 4, 4, 0, 0}, before, after);

    CHECK_FALSE(r.missing);
    CHECK(r.scatter == doctest::Approx(0.0f));
    CHECK(r.adjacency == doctest::Approx(0.0f));
    CHECK(r.topDown == doctest::Approx(0.0f));
    CHECK(r.cornerEdge == doctest::Approx(8.0f));
    CHECK(r.newStock == doctest::Approx(-6.0f).epsilon(1e-5f));
    CHECK(r.utilization == doctest::Approx(4.8f).epsilon(1e-5f));
    CHECK(r.isolation == doctest::Approx(-4.1472f).epsilon(1e-4f));
    CHECK(r.total() == doctest::Approx(2.6528f).epsilon(1e-4f));
}

TEST_CASE("RewardShaper: ScatterIsMeasuredOnPriorMaterial") {
    StockGrid prior = makeEmptyStock(10, 10);
    prior(9, 9) = 0;
    StockGrid placed = prior;
    placed(3, 3) = 1;

    Observation before = makeObservation({prior}, {{1, 1, 1}});
    Observation after = makeObservation({placed}, {{1, 1, 0}});

    RewardBreakdown r = RewardShaper().evaluate(Placement{0, 1, 1, 3, 3}, before, after);
    CHECK(r.scatter == doctest::Approx(-25.3125f).epsilon(1e-4f));
    CHECK(r.adjacency == doctest::Approx(0.0f));
    CHECK(r.topDown == doctest::Approx(-1.728f).epsilon(1e-4f));
    CHECK(r.cornerEdge == doctest::Approx(0.0f));
    CHECK(r.newStock == doctest::Approx(0.0f));
    CHECK(r.total() == doctest::Approx(sumOfTerms(r)).epsilon(1e-5f));
}

TEST_CASE("RewardShaper: TopDownPenaltyIsCapped") {
    StockGrid prior = makeEmptyStock(10, 10);
    prior(9, 9) = 0;
    StockGrid placed = prior;
    placed(0, 7) = 1;

    Observation before = makeObservation({prior}, {{1, 1, 1}});
    Observation after = makeObservation({placed}, {{1, 1, 0}});

    RewardBreakdown r = RewardShaper().evaluate(Placement{0, 1, 1, 0, 7}, before, after);
    // Seven empty cells above, exponent capped at 5
    CHECK(r.topDown == doctest::Approx(-2.48832f).epsilon(1e-4f));
    CHECK(r.cornerEdge == doctest::Approx(4.0f));
}

TEST_CASE("RewardShaper: AdjacencyReplacesScatter") {
    Observation before = makeObservation({stockWithBlock(10, 10, 0, 0, 2, 2)}, {{2, 2, 1}});
    StockGrid placed = stockWithBlock(10, 10, 0, 0, 2, 2);
    fillBlock(placed, 2, 0, 2, 2, 1);
    Observation after = makeObservation({placed}, {{2, 2, 0}});

    RewardBreakdown r = RewardShaper().evaluate(Placement{0, 2, 2, 2, 0}, before, after);
    CHECK(r.scatter == doctest::Approx(0.0f));
    CHECK(r.adjacency == doctest::Approx(4.1472f).epsilon(1e-4f));
    CHECK(r.cornerEdge == doctest::Approx(4.0f));
    CHECK(r.newStock == doctest::Approx(0.0f));
    CHECK(r.utilization == doctest::Approx(30.0f * (0.08f - 0.04f)).epsilon(1e-4f));
    CHECK(r.total() == doctest::Approx(sumOfTerms(r)).epsilon(1e-5f));
}

TEST_CASE("RewardShaper: MissingPlacement") {
    Observation obs = makeObservation({makeEmptyStock(5, 5)}, {{1, 1, 1}});
    RewardShaper shaper;

    RewardBreakdown none = shaper.evaluate(std::nullopt, obs, obs);
    CHECK(none.missing);
    CHECK(none.total() == doctest::Approx(RewardShaper::kMissingPlacementReward));

    RewardBreakdown outOfRange = shaper.evaluate(Placement{3, 1, 1, 0, 0}, obs, obs);
    CHECK(outOfRange.missing);
    CHECK(outOfRange.total() == doctest::Approx(-10.0f));
}
