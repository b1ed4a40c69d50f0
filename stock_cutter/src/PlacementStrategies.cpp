#include "PlacementStrategies.h"
#include "PatternEvaluator.h"
#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

const char* decisionSourceName(DecisionSource source) {
    switch (source) {
    case DecisionSource::None: return "none";
    case DecisionSource::Structured: return "structured";
    case DecisionSource::Learned: return "learned";
    case DecisionSource::RandomFallback: return "random";
    case DecisionSource::Greedy: return "greedy";
    }
    return "unknown";
}

namespace placement {

namespace {

struct Orientation {
    int w;
    int h;
    bool rotated;
};

// Declared orientation first unless the rotated one is preferred
std::vector<Orientation> orientationsOf(const ProductDemand& product, bool rotatedFirst = false) {
    Orientation declared{product.width, product.height, false};
    Orientation rotated{product.height, product.width, product.width != product.height};
    if (rotatedFirst) return {rotated, declared};
    return {declared, rotated};
}

} // namespace

std::optional<int> largestProductIndex(const Observation& obs) {
    std::optional<int> best;
    int bestArea = 0;

    for (int i = 0; i < static_cast<int>(obs.products.size()); ++i) {
        const ProductDemand& product = obs.products[i];
        if (product.quantity <= 0) continue;
        if (product.area() > bestArea) {
            bestArea = product.area();
            best = i;
        }
    }
    return best;
}

std::optional<int> findBestFittingStock(const Observation& obs) {
    std::optional<int> best;
    float bestScore = -std::numeric_limits<float>::infinity();
    std::optional<int> firstEmpty;

    for (int i = 0; i < static_cast<int>(obs.stocks.size()); ++i) {
        const StockGrid& stock = obs.stocks[i];
        int used = occupiedCells(stock);

        if (used == 0) {
            if (!firstEmpty) firstEmpty = i;
            continue;
        }
        if (used >= stockArea(stock)) continue;

        float utilization = stockFillRatio(stock);
        if (utilization >= 0.8f) continue;

        float score = 100.0f + (0.8f - utilization) * 50.0f;
        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }

    return best ? best : firstEmpty;
}

Decision structuredPlacement(const Observation& obs) {
    std::optional<int> productIdx = largestProductIndex(obs);
    if (!productIdx) return std::nullopt;

    const int w = obs.products[*productIdx].width;
    const int h = obs.products[*productIdx].height;

    for (int s = 0; s < static_cast<int>(obs.stocks.size()); ++s) {
        const StockGrid& stock = obs.stocks[s];
        const int sw = stockWidth(stock);
        const int sh = stockHeight(stock);

        if (isStockEmpty(stock)) {
            const std::pair<int, int> corners[] = {
                {0, 0}, {sw - w, 0}, {0, sh - h}, {sw - w, sh - h}
            };
            for (const auto& corner : corners) {
                if (pattern::canPlace(stock, corner.first, corner.second, w, h)) {
                    return Placement{s, w, h, corner.first, corner.second};
                }
            }
        }

        std::vector<std::pair<int, int>> edges;
        for (int x = 0; x <= sw - w; ++x) edges.emplace_back(x, 0);        // top
        for (int y = 0; y <= sh - h; ++y) edges.emplace_back(0, y);        // left
        for (int x = 0; x <= sw - w; ++x) edges.emplace_back(x, sh - h);   // bottom
        for (int y = 0; y <= sh - h; ++y) edges.emplace_back(sw - w, y);   // right

        for (const auto& edge : edges) {
            if (pattern::canPlace(stock, edge.first, edge.second, w, h)) {
                return Placement{s, w, h, edge.first, edge.second};
            }
        }
    }

    return std::nullopt;
}

DecodedAction decodeAction(int action, int stockCount) {
    DecodedAction decoded;
    decoded.rotatedHint = action >= ActionSpace::kRotationOffset;
    if (decoded.rotatedHint) action -= ActionSpace::kRotationOffset;

    decoded.stockIndex = std::min(action / ActionSpace::kCellsPerStock, stockCount - 1);
    int cell = action % ActionSpace::kCellsPerStock;
    decoded.cellX = cell / ActionSpace::kGridSize;
    decoded.cellY = cell % ActionSpace::kGridSize;
    return decoded;
}

Decision realizeDecodedAction(const Observation& obs, const DecodedAction& decoded, float rotationBonus) {
    if (decoded.stockIndex < 0 || decoded.stockIndex >= static_cast<int>(obs.stocks.size())) {
        return std::nullopt;
    }

    const StockGrid& stock = obs.stocks[decoded.stockIndex];
    const int sw = stockWidth(stock);
    const int sh = stockHeight(stock);

    Decision best;
    float bestScore = -std::numeric_limits<float>::infinity();

    for (const ProductDemand& product : obs.products) {
        if (product.quantity <= 0) continue;

        for (const Orientation& o : orientationsOf(product, decoded.rotatedHint)) {
            int x = std::min(decoded.cellX * sw / ActionSpace::kGridSize, sw - o.w);
            int y = std::min(decoded.cellY * sh / ActionSpace::kGridSize, sh - o.h);
            if (!pattern::canPlace(stock, x, y, o.w, o.h)) continue;

            float score = pattern::patternScore(stock, x, y, o.w, o.h);
            if (o.rotated) score *= rotationBonus;

            if (score > bestScore) {
                bestScore = score;
                best = Placement{decoded.stockIndex, o.w, o.h, x, y};
            }
        }
    }

    return best;
}

Decision randomValidPlacement(const Observation& obs, int trials, std::mt19937& rng) {
    for (int s = 0; s < static_cast<int>(obs.stocks.size()); ++s) {
        const StockGrid& stock = obs.stocks[s];
        const int sw = stockWidth(stock);
        const int sh = stockHeight(stock);

        for (const ProductDemand& product : obs.products) {
            if (product.quantity <= 0) continue;

            for (const Orientation& o : orientationsOf(product)) {
                if (o.w > sw || o.h > sh) continue;

                std::uniform_int_distribution<int> xDist(0, sw - o.w);
                std::uniform_int_distribution<int> yDist(0, sh - o.h);
                for (int t = 0; t < trials; ++t) {
                    int x = xDist(rng);
                    int y = yDist(rng);
                    if (pattern::canPlace(stock, x, y, o.w, o.h)) {
                        return Placement{s, o.w, o.h, x, y};
                    }
                }
            }
        }
    }

    return std::nullopt;
}

GreedySearchResult greedyPlacement(const Observation& obs, int budget, float rotationBonus) {
    GreedySearchResult result;

    std::vector<const ProductDemand*> products;
    for (const ProductDemand& product : obs.products) {
        if (product.quantity > 0) products.push_back(&product);
    }
    std::stable_sort(products.begin(), products.end(),
                     [](const ProductDemand* a, const ProductDemand* b) { return a->area() > b->area(); });

    float bestScore = -std::numeric_limits<float>::infinity();

    for (const ProductDemand* product : products) {
        for (const Orientation& o : orientationsOf(*product)) {
            for (int s = 0; s < static_cast<int>(obs.stocks.size()); ++s) {
                const StockGrid& stock = obs.stocks[s];
                const int sw = stockWidth(stock);
                const int sh = stockHeight(stock);
                if (sw < o.w || sh < o.h) continue;

                for (int y = 0; y <= sh - o.h; ++y) {
                    for (int x = 0; x <= sw - o.w; ++x) {
                        if (result.attempts >= budget) return result;
                        ++result.attempts;

                        if (!pattern::canPlace(stock, x, y, o.w, o.h)) continue;

                        float score = pattern::greedyPlacementScore(stock, x, y, o.w, o.h);
                        if (o.rotated && score > 0.0f) score *= rotationBonus;

                        if (score > bestScore) {
                            bestScore = score;
                            result.placement = Placement{s, o.w, o.h, x, y};
                        }
                    }
                }
            }
        }
    }

    return result;
}

} // namespace placement
