#include <doctest/doctest.h>
#include "PatternEvaluator.h"
#include "TestHelpers.h"

using namespace testing_helpers;

TEST_CASE("PatternEvaluator: CanPlaceChecksBoundsAndOccupancy") {
    StockGrid stock = stockWithBlock(10, 10, 4, 4, 2, 2);

    CHECK(pattern::canPlace(stock, 0, 0, 4, 4));
    CHECK(pattern::canPlace(stock, 6, 6, 4, 4));
    CHECK_FALSE(pattern::canPlace(stock, 7, 7, 4, 4));   // past the edge
    CHECK_FALSE(pattern::canPlace(stock, -1, 0, 2, 2));
    CHECK_FALSE(pattern::canPlace(stock, 3, 3, 2, 2));   // overlaps the block
    CHECK_FALSE(pattern::canPlace(stock, 0, 0, 0, 2));
    CHECK(pattern::canPlace(stock, Placement{0, 4, 4, 0, 0}));
}

TEST_CASE("PatternEvaluator: AdjacentWeightSeparatesSidesAndCorners") {
    StockGrid stock = makeEmptyStock(10, 10);
    CHECK(pattern::adjacentWeight(stock, 4, 4, 1, 1) == doctest::Approx(0.0f));

    stock(4, 3) = 1;   // directly above
    CHECK(pattern::adjacentWeight(stock, 4, 4, 1, 1) == doctest::Approx(2.0f));

    stock(3, 3) = 2;   // diagonal
    CHECK(pattern::adjacentWeight(stock, 4, 4, 1, 1) == doctest::Approx(2.25f));
}

TEST_CASE("PatternEvaluator: EmptyNeighborCountSkipsOutOfBounds") {
    StockGrid stock = makeEmptyStock(10, 10);
    CHECK(pattern::emptyNeighborCount(stock, 0, 0, 2, 2) == 5);
    CHECK(pattern::emptyNeighborCount(stock, 4, 4, 2, 2) == 12);

    stock(2, 0) = 0;
    CHECK(pattern::emptyNeighborCount(stock, 0, 0, 2, 2) == 4);
}

TEST_CASE("PatternEvaluator: DistanceToNearestFilled") {
    StockGrid stock = makeEmptyStock(10, 10);
    CHECK(pattern::distanceToNearestFilled(stock, 2, 3) == 0);

    stock(5, 5) = 0;
    stock(9, 0) = 1;
    CHECK(pattern::distanceToNearestFilled(stock, 2, 3) == 5);
    CHECK(pattern::distanceToNearestFilled(stock, 9, 2) == 2);
}

TEST_CASE("PatternEvaluator: ConnectedEmptyAreaUsesFourConnectivity") {
    StockGrid stock = stockWithBlock(5, 5, 2, 0, 1, 5);   // wall down the middle

    CHECK(pattern::connectedEmptyAreaSize(stock, 0, 0) == 10);
    CHECK(pattern::connectedEmptyAreaSize(stock, 4, 4) == 10);
    CHECK(pattern::connectedEmptyAreaSize(stock, 2, 2) == 0);
    CHECK(pattern::connectedEmptyAreaSize(stock, 5, 0) == 0);

    // Diagonal contact does not join regions
    StockGrid diagonal = makeEmptyStock(2, 2);
    diagonal(1, 0) = 0;
    diagonal(0, 1) = 0;
    CHECK(pattern::connectedEmptyAreaSize(diagonal, 0, 0) == 1);
}

TEST_CASE("PatternEvaluator: PerfectFitNeedsTwoFlushEdges") {
    StockGrid stock = stockWithBlock(10, 10, 0, 0, 2, 10);   // material on the left

    CHECK_FALSE(pattern::isPerfectFit(stock, 2, 0, 2, 2));

    fillBlock(stock, 2, 2, 2, 1);   // and right below the candidate
    CHECK(pattern::isPerfectFit(stock, 2, 0, 2, 2));
}

TEST_CASE("PatternEvaluator: PerfectFitAcceptsPartialAlignment") {
    StockGrid stock = stockWithBlock(10, 10, 2, 0, 1, 10);   // full edge one width to the left
    CHECK_FALSE(pattern::isPerfectFit(stock, 4, 0, 2, 2));

    stock(6, 0) = 1;   // half of the edge one width to the right
    CHECK(pattern::isPerfectFit(stock, 4, 0, 2, 2));
}

TEST_CASE("PatternEvaluator: EmptyCellsAbove") {
    StockGrid stock = makeEmptyStock(10, 10);
    CHECK(pattern::emptyCellsAbove(stock, 2, 3, 2) == 6);
    CHECK(pattern::emptyCellsAbove(stock, 2, 0, 2) == 0);

    fillBlock(stock, 2, 0, 2, 3);
    CHECK(pattern::emptyCellsAbove(stock, 2, 3, 2) == 0);
}

TEST_CASE("PatternEvaluator: IsolationRiskCountsSmallNeighbourRegions") {
    StockGrid narrow = stockWithBlock(4, 2, 1, 0, 1, 2);
    // One width to the left is a 1x2 pocket, smaller than the 2x2 piece
    CHECK(pattern::isolationRisk(narrow, 2, 0, 2, 2) == 1);

    StockGrid wide = makeEmptyStock(10, 10);
    CHECK(pattern::isolationRisk(wide, 0, 0, 2, 2) == 0);
}

TEST_CASE("PatternEvaluator: SmallGapCountFindsPocketsNearThePiece") {
    StockGrid stock = stockWithBlock(6, 6, 0, 0, 6, 6);
    fillBlock(stock, 3, 3, 3, 3, kEmptyCell);   // room for the piece
    stock(1, 1) = kEmptyCell;                    // single-cell pocket

    CHECK(pattern::smallGapCount(stock, 3, 3, 3, 3) == 1);

    stock(1, 1) = 0;
    CHECK(pattern::smallGapCount(stock, 3, 3, 3, 3) == 0);
}

TEST_CASE("PatternEvaluator: CountNearbySmallPieces") {
    StockGrid stock = makeEmptyStock(10, 10);
    stock(0, 0) = 7;
    fillBlock(stock, 5, 5, 5, 5, 8);

    CHECK(pattern::countNearbySmallPieces(stock, 2, 0, 1, 1) == 1);
    CHECK(pattern::countNearbySmallPieces(stock, 9, 0, 1, 1) == 0);
}

TEST_CASE("PatternEvaluator: PatternScoreRegimes") {
    StockGrid stock = makeEmptyStock(10, 10);

    // Small piece: corner 3, no neighbours, empty stock has distance 0
    CHECK(pattern::patternScore(stock, 0, 0, 2, 2) == doctest::Approx(3.0f));
    CHECK(pattern::patternScore(stock, 3, 0, 2, 2) == doctest::Approx(2.0f));
    CHECK(pattern::patternScore(stock, 3, 3, 2, 2) == doctest::Approx(0.0f));

    // Large piece: both edges and the corner bonus
    CHECK(pattern::patternScore(stock, 0, 0, 5, 4) == doctest::Approx(7.0f));
    CHECK(pattern::patternScore(stock, 2, 0, 5, 4) == doctest::Approx(2.0f));
}

TEST_CASE("PatternEvaluator: GreedyScoreOnEmptyStockPrefersCorners") {
    StockGrid stock = makeEmptyStock(10, 10);

    CHECK(pattern::greedyPlacementScore(stock, 0, 0, 2, 2) == doctest::Approx(10.0f));
    CHECK(pattern::greedyPlacementScore(stock, 4, 0, 2, 2) == doctest::Approx(5.0f));
    // Six empty cells above the footprint
    CHECK(pattern::greedyPlacementScore(stock, 3, 3, 2, 2) == doctest::Approx(-90.0f));
}

TEST_CASE("PatternEvaluator: GreedyScoreRewardsUsedStocks") {
    StockGrid used = stockWithBlock(10, 10, 0, 0, 2, 2);
    StockGrid empty = makeEmptyStock(10, 10);

    float onUsed = pattern::greedyPlacementScore(used, 2, 0, 2, 2);
    float onEmpty = pattern::greedyPlacementScore(empty, 0, 0, 2, 2);
    CHECK(onUsed > onEmpty);
    CHECK(onUsed >= 50.0f);
}
