#include "RewardShaper.h"
#include "PatternEvaluator.h"
#include <algorithm>
#include <cmath>

namespace {

// scale * min(cap, base^min(count, maxExponent))
float boundedGrowth(float scale, float cap, float base, float count, float maxExponent) {
    return scale * std::min(cap, std::pow(base, std::min(count, maxExponent)));
}

} // namespace

float RewardBreakdown::total() const {
    if (missing) return RewardShaper::kMissingPlacementReward;
    return scatter + adjacency + topDown + cornerEdge + newStock + utilization + isolation;
}

RewardBreakdown RewardShaper::evaluate(const Decision& decision,
                                       const Observation& before,
                                       const Observation& after) const {
    RewardBreakdown r;

    const int stockCount = static_cast<int>(std::min(before.stocks.size(), after.stocks.size()));
    if (!decision || decision->stockIndex < 0 || decision->stockIndex >= stockCount) {
        r.missing = true;
        return r;
    }

    const Placement& p = *decision;
    const StockGrid& prior = before.stocks[p.stockIndex];
    const StockGrid& stock = after.stocks[p.stockIndex];

    float adjacent = pattern::adjacentWeight(stock, p.x, p.y, p.width, p.height);
    if (adjacent == 0.0f) {
        if (!isStockEmpty(prior)) {
            float distance = static_cast<float>(pattern::distanceToNearestFilled(prior, p.x, p.y));
            r.scatter = -boundedGrowth(5.0f, 8.0f, 1.5f, distance, 4.0f);
        }
    } else {
        r.adjacency = boundedGrowth(2.0f, 5.0f, 1.2f, adjacent, 4.0f);
    }

    int above = pattern::emptyCellsAbove(stock, p.x, p.y, p.width);
    if (above > 0) {
        r.topDown = -boundedGrowth(1.0f, 10.0f, 1.2f, static_cast<float>(above), 5.0f);
    }

    if (p.x == 0 && p.y == 0) {
        r.cornerEdge = 8.0f;
    } else if (p.x == 0 || p.y == 0) {
        r.cornerEdge = 4.0f;
    }

    if (occupiedCells(stock) == p.area() && p.area() < 0.3f * stockArea(stock)) {
        float used = static_cast<float>(usedStockCount(after));
        r.newStock = -boundedGrowth(5.0f, 8.0f, 1.2f, used, 5.0f);
    }

    r.utilization = 30.0f * (correctedFilledRatio(after) - correctedFilledRatio(before));

    int emptyNeighbors = pattern::emptyNeighborCount(stock, p.x, p.y, p.width, p.height);
    if (emptyNeighbors > 0) {
        r.isolation = -boundedGrowth(2.0f, 5.0f, 1.2f, static_cast<float>(emptyNeighbors), 4.0f);
    }

    return r;
}
