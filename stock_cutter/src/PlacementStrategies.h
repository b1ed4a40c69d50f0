#ifndef PLACEMENTSTRATEGIES_H
#define PLACEMENTSTRATEGIES_H

#include "CuttingTypes.h"
#include <optional>
#include <random>

/**
 * @brief Layout of the discrete action space
 *
 * action = rotation * kRotationOffset + stock * kCellsPerStock + cellX * kGridSize + cellY
 *
 * The split point is fixed by kMaxStocks, not by the number of stocks in
 * the current observation. Stock indices past the last real stock are
 * clamped to it.
 */
struct ActionSpace {
    static constexpr int kMaxStocks = 100;
    static constexpr int kGridSize = 5;
    static constexpr int kCellsPerStock = kGridSize * kGridSize;
    static constexpr int kRotationOffset = kMaxStocks * kCellsPerStock;
    static constexpr int kActionCount = 2 * kRotationOffset;
};

struct DecodedAction {
    bool rotatedHint = false;
    int stockIndex = 0;
    int cellX = 0;
    int cellY = 0;
};

// Which stage of the decision pipeline produced a decision
enum class DecisionSource {
    None,
    Structured,
    Learned,
    RandomFallback,
    Greedy
};

const char* decisionSourceName(DecisionSource source);

struct GreedySearchResult {
    Decision placement;
    int attempts = 0;   // candidate positions evaluated
};

namespace placement {

// Index of the eligible product with the largest area; the first one wins ties
std::optional<int> largestProductIndex(const Observation& obs);

/**
 * @brief Stock the learned decoder is nudged towards
 *
 * Partially filled stocks below 80% occupancy score 100 + (0.8 - u) * 50,
 * the best one wins. Without such a stock the first untouched stock is
 * used. Returns std::nullopt if neither exists.
 */
std::optional<int> findBestFittingStock(const Observation& obs);

/**
 * @brief Corner-then-edge placement of the largest remaining product
 *
 * Stocks are visited in order. An empty stock tries its corners (top-left,
 * top-right, bottom-left, bottom-right); any stock then tries edge-aligned
 * positions along the top, left, bottom and right edges. The declared
 * orientation is used.
 */
Decision structuredPlacement(const Observation& obs);

// stockCount must be positive
DecodedAction decodeAction(int action, int stockCount);

/**
 * @brief Turn a decoded action hint into a concrete placement
 *
 * The coarse cell is scaled into the stock and clamped so the piece stays
 * inside. Every eligible product is tried in both orientations, the hinted
 * orientation first; the valid candidate with the best pattern score wins,
 * rotated candidates being scaled by rotationBonus.
 */
Decision realizeDecodedAction(const Observation& obs, const DecodedAction& decoded,
                              float rotationBonus = 1.1f);

// Up to `trials` uniformly random positions per stock / product / orientation
Decision randomValidPlacement(const Observation& obs, int trials, std::mt19937& rng);

/**
 * @brief Exhaustive scan ranked by pattern::greedyPlacementScore
 *
 * Products are visited largest first, both orientations, every stock that
 * can hold the orientation, every position row by row. The scan stops
 * after `budget` evaluated positions and returns the best seen so far.
 */
GreedySearchResult greedyPlacement(const Observation& obs, int budget = 1000,
                                   float rotationBonus = 1.05f);

} // namespace placement

#endif // PLACEMENTSTRATEGIES_H
