#include "PatternEvaluator.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pattern {

namespace {

inline bool inBounds(const StockGrid& stock, int x, int y) {
    return x >= 0 && y >= 0 && x < stock.rows() && y < stock.cols();
}

inline bool isEmptyAt(const StockGrid& stock, int x, int y) {
    return stock(x, y) == kEmptyCell;
}

} // namespace

bool canPlace(const StockGrid& stock, int x, int y, int w, int h) {
    if (w <= 0 || h <= 0) return false;
    if (x < 0 || y < 0) return false;
    if (x + w > stock.rows() || y + h > stock.cols()) return false;

    return (stock.block(x, y, w, h).array() == kEmptyCell).all();
}

float adjacentWeight(const StockGrid& stock, int x, int y, int w, int h) {
    float weight = 0.0f;

    for (int dx = -1; dx <= w; ++dx) {
        for (int dy = -1; dy <= h; ++dy) {
            if (dx >= 0 && dx < w && dy >= 0 && dy < h) continue;

            int cx = x + dx;
            int cy = y + dy;
            if (!inBounds(stock, cx, cy) || isEmptyAt(stock, cx, cy)) continue;

            bool corner = (dx == -1 || dx == w) && (dy == -1 || dy == h);
            weight += corner ? kDiagonalNeighborWeight : kOrthogonalNeighborWeight;
        }
    }

    return weight;
}

int emptyNeighborCount(const StockGrid& stock, int x, int y, int w, int h) {
    int count = 0;

    for (int dx = -1; dx <= w; ++dx) {
        for (int dy = -1; dy <= h; ++dy) {
            if (dx >= 0 && dx < w && dy >= 0 && dy < h) continue;

            int cx = x + dx;
            int cy = y + dy;
            if (inBounds(stock, cx, cy) && isEmptyAt(stock, cx, cy)) ++count;
        }
    }

    return count;
}

int distanceToNearestFilled(const StockGrid& stock, int x, int y) {
    int best = std::numeric_limits<int>::max();

    for (int cx = 0; cx < stock.rows(); ++cx) {
        for (int cy = 0; cy < stock.cols(); ++cy) {
            if (isEmptyAt(stock, cx, cy)) continue;
            best = std::min(best, std::abs(cx - x) + std::abs(cy - y));
        }
    }

    return best == std::numeric_limits<int>::max() ? 0 : best;
}

int connectedEmptyAreaSize(const StockGrid& stock, int x, int y) {
    if (!inBounds(stock, x, y) || !isEmptyAt(stock, x, y)) return 0;

    Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> visited =
        Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>::Constant(stock.rows(), stock.cols(), false);

    std::vector<std::pair<int, int>> stack;
    stack.emplace_back(x, y);
    visited(x, y) = true;
    int area = 0;

    static constexpr int kDx[4] = {-1, 1, 0, 0};
    static constexpr int kDy[4] = {0, 0, -1, 1};

    while (!stack.empty()) {
        auto [cx, cy] = stack.back();
        stack.pop_back();
        ++area;

        for (int d = 0; d < 4; ++d) {
            int nx = cx + kDx[d];
            int ny = cy + kDy[d];
            if (inBounds(stock, nx, ny) && !visited(nx, ny) && isEmptyAt(stock, nx, ny)) {
                visited(nx, ny) = true;
                stack.emplace_back(nx, ny);
            }
        }
    }

    return area;
}

bool isPerfectFit(const StockGrid& stock, int x, int y, int w, int h) {
    static constexpr int kDirections[4][2] = {{0, 1}, {0, -1}, {1, 0}, {-1, 0}};

    int fullEdges = 0;
    float alignmentQuality = 0.0f;

    for (const auto& dir : kDirections) {
        int checkX = x + dir[0] * w;
        int checkY = y + dir[1] * h;
        if (!inBounds(stock, checkX, checkY)) continue;

        int aligned = 0;
        int extent = 0;
        if (dir[0] != 0) {
            extent = h;
            for (int cy = y; cy < y + h; ++cy) {
                if (inBounds(stock, checkX, cy) && !isEmptyAt(stock, checkX, cy)) ++aligned;
            }
        } else {
            extent = w;
            for (int cx = x; cx < x + w; ++cx) {
                if (inBounds(stock, cx, checkY) && !isEmptyAt(stock, cx, checkY)) ++aligned;
            }
        }

        if (aligned == extent) ++fullEdges;
        alignmentQuality += static_cast<float>(aligned) / static_cast<float>(extent);
    }

    return fullEdges >= 2 || alignmentQuality >= 1.5f;
}

int countNearbySmallPieces(const StockGrid& stock, int x, int y, int w, int h) {
    const int padding = 3;
    int xStart = std::max(0, x - padding);
    int xEnd = std::min(static_cast<int>(stock.rows()), x + w + padding);
    int yStart = std::max(0, y - padding);
    int yEnd = std::min(static_cast<int>(stock.cols()), y + h + padding);

    std::unordered_map<int, int> cellsPerOccupant;
    for (int cx = xStart; cx < xEnd; ++cx) {
        for (int cy = yStart; cy < yEnd; ++cy) {
            int id = stock(cx, cy);
            if (id != kEmptyCell) ++cellsPerOccupant[id];
        }
    }

    int small = 0;
    for (const auto& entry : cellsPerOccupant) {
        if (entry.second < kSmallPieceArea) ++small;
    }
    return small;
}

int emptyCellsAbove(const StockGrid& stock, int x, int y, int w) {
    int gaps = 0;
    int xEnd = std::min(static_cast<int>(stock.rows()), x + w);
    int yEnd = std::min(static_cast<int>(stock.cols()), y);

    for (int cx = std::max(0, x); cx < xEnd; ++cx) {
        for (int cy = 0; cy < yEnd; ++cy) {
            if (isEmptyAt(stock, cx, cy)) ++gaps;
        }
    }
    return gaps;
}

int isolationRisk(const StockGrid& stock, int x, int y, int w, int h) {
    static constexpr int kDirections[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

    int risk = 0;
    for (const auto& dir : kDirections) {
        int checkX = x + dir[0] * w;
        int checkY = y + dir[1] * h;
        if (!inBounds(stock, checkX, checkY)) continue;

        int area = connectedEmptyAreaSize(stock, checkX, checkY);
        if (area > 0 && area < w * h) ++risk;
    }
    return risk;
}

int smallGapCount(const StockGrid& stock, int x, int y, int w, int h) {
    const int padding = 2;
    int count = 0;

    for (int dx = -padding; dx < w + padding; ++dx) {
        for (int dy = -padding; dy < h + padding; ++dy) {
            int cx = x + dx;
            int cy = y + dy;
            if (!inBounds(stock, cx, cy) || !isEmptyAt(stock, cx, cy)) continue;

            int gap = connectedEmptyAreaSize(stock, cx, cy);
            if (gap > 0 && gap < kSmallGapArea) ++count;
        }
    }
    return count;
}

float patternScore(const StockGrid& stock, int x, int y, int w, int h) {
    const int stockW = stockWidth(stock);
    const int stockH = stockHeight(stock);
    float score = 0.0f;

    if (w * h < kSmallPieceArea) {
        if (x == 0 && y == 0) {
            score += 3.0f;
        } else if (x == 0 || y == 0) {
            score += 2.0f;
        }

        score += 1.5f * static_cast<float>(countNearbySmallPieces(stock, x, y, w, h));
        score -= 0.5f * static_cast<float>(distanceToNearestFilled(stock, x, y));
    } else {
        bool alongX = (x == 0 || x + w == stockW);
        bool alongY = (y == 0 || y + h == stockH);

        if (alongX) score += 2.0f;
        if (alongY) score += 2.0f;
        if (alongX && alongY) score += 3.0f;

        score += 2.0f * stockFillRatio(stock);
    }

    return score;
}

float greedyPlacementScore(const StockGrid& stock, int x, int y, int w, int h) {
    const int stockW = stockWidth(stock);
    const int stockH = stockHeight(stock);
    const float utilization = stockFillRatio(stock);
    float score = 0.0f;

    if (utilization > 0.0f) {
        score += 50.0f;

        float adjacency = adjacentWeight(stock, x, y, w, h);
        if (adjacency >= 2.0f) {
            score += 60.0f * std::pow(2.0f, adjacency - 1.0f);
        } else {
            score += 30.0f * adjacency;
        }
        if (adjacency >= 3.0f) {
            score += 100.0f;
        }

        if (isPerfectFit(stock, x, y, w, h)) {
            score += 50.0f;
        }

        if (utilization < 0.6f) {
            float centerX = static_cast<float>(stockW / 2);
            float centerY = static_cast<float>(stockH / 2);
            float distToCenter = std::abs(x + w / 2.0f - centerX) + std::abs(y + h / 2.0f - centerY);
            score += std::max(0.0f, 25.0f - distToCenter);
        }
    } else if (utilization < 0.3f) {
        bool alongX = (x == 0 || x + w == stockW);
        bool alongY = (y == 0 || y + h == stockH);
        if (alongX && alongY) {
            score += 10.0f;
        } else if (alongX || alongY) {
            score += 5.0f;
        }
    }

    score -= 15.0f * static_cast<float>(emptyCellsAbove(stock, x, y, w));
    score -= 20.0f * static_cast<float>(isolationRisk(stock, x, y, w, h));
    score -= 25.0f * static_cast<float>(smallGapCount(stock, x, y, w, h));

    return score;
}

} // namespace pattern
