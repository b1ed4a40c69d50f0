#ifndef PATTERNEVALUATOR_H
#define PATTERNEVALUATOR_H

#include "CuttingTypes.h"

/**
 * @brief Geometry queries and placement-quality heuristics on one stock
 *
 * All functions are pure. A candidate rectangle is given by its top-left
 * corner (x, y) and its size (w, h) in the orientation being evaluated.
 * The halo of a rectangle is the ring of cells one step outside it.
 */
namespace pattern {

// Pieces below this area use the small-piece scoring regime
constexpr int kSmallPieceArea = 20;

// Empty regions below this size count as unusable gaps
constexpr int kSmallGapArea = 4;

constexpr float kOrthogonalNeighborWeight = 2.0f;
constexpr float kDiagonalNeighborWeight = 0.25f;

// True iff the rectangle lies inside the stock and covers only empty cells
bool canPlace(const StockGrid& stock, int x, int y, int w, int h);

inline bool canPlace(const StockGrid& stock, const Placement& p) {
    return canPlace(stock, p.x, p.y, p.width, p.height);
}

// Weighted count of occupied halo cells: 2.0 along the sides, 0.25 at the corners
float adjacentWeight(const StockGrid& stock, int x, int y, int w, int h);

// Number of empty, in-bounds halo cells
int emptyNeighborCount(const StockGrid& stock, int x, int y, int w, int h);

// Manhattan distance from (x, y) to the closest occupied cell, 0 for an empty stock
int distanceToNearestFilled(const StockGrid& stock, int x, int y);

// Size of the 4-connected empty region containing (x, y); 0 if occupied or outside
int connectedEmptyAreaSize(const StockGrid& stock, int x, int y);

/**
 * @brief Flush-fit test against existing material
 *
 * Probes the four axis directions at a distance equal to the piece's own
 * extent and checks how much of the opposing edge is occupied. A fit needs
 * two fully occupied edges, or an accumulated alignment of at least 1.5.
 */
bool isPerfectFit(const StockGrid& stock, int x, int y, int w, int h);

// Distinct small occupants (< kSmallPieceArea cells) in a 3-cell padded window
int countNearbySmallPieces(const StockGrid& stock, int x, int y, int w, int h);

// Empty cells between the top edge and the rectangle, over its columns
int emptyCellsAbove(const StockGrid& stock, int x, int y, int w);

// Neighbouring empty regions (probed one extent away) smaller than the piece
int isolationRisk(const StockGrid& stock, int x, int y, int w, int h);

// Empty cells in a 2-cell padded window whose region has 1-3 cells
int smallGapCount(const StockGrid& stock, int x, int y, int w, int h);

/**
 * @brief Composite score used to rank decoded placements
 *
 * Small pieces favour corners, edges and clusters of other small pieces and
 * are penalised by their distance to existing material. Large pieces favour
 * edge alignment, corners and stocks that are already well used.
 */
float patternScore(const StockGrid& stock, int x, int y, int w, int h);

/**
 * @brief Priority score used by the exhaustive greedy search
 *
 * Partially used stocks start at 50 and collect adjacency, perfect-fit and
 * centre bonuses; empty stocks only collect small corner/edge bonuses.
 * Gaps above, isolation risk and small gaps are subtracted in both cases.
 */
float greedyPlacementScore(const StockGrid& stock, int x, int y, int w, int h);

} // namespace pattern

#endif // PATTERNEVALUATOR_H
