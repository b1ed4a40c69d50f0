#ifndef CUTTINGTYPES_H
#define CUTTINGTYPES_H

#include <Eigen/Core>
#include <optional>
#include <vector>

/**
 * @brief Occupancy grid of one stock sheet
 *
 * Indexed (x, y): rows = width, cols = height.
 * A cell holds kEmptyCell or the id of the product occupying it.
 * Row y = 0 is the top edge of the sheet.
 */
using StockGrid = Eigen::MatrixXi;

constexpr int kEmptyCell = -1;

struct ProductDemand {
    int width = 0;
    int height = 0;
    int quantity = 0;

    int area() const { return width * height; }
};

struct Observation {
    std::vector<StockGrid> stocks;
    std::vector<ProductDemand> products;
};

// Side channel reported by the environment with every observation
struct StepInfo {
    float filledRatio = 0.0f;
};

/**
 * @brief Concrete placement of one product
 *
 * width/height reflect the orientation that was chosen, so they may be the
 * product's declared size swapped.
 */
struct Placement {
    int stockIndex = 0;
    int width = 0;
    int height = 0;
    int x = 0;
    int y = 0;

    int area() const { return width * height; }

    bool operator==(const Placement& other) const {
        return stockIndex == other.stockIndex && width == other.width &&
               height == other.height && x == other.x && y == other.y;
    }
    bool operator!=(const Placement& other) const { return !(*this == other); }
};

using Decision = std::optional<Placement>;

inline int stockWidth(const StockGrid& stock) { return static_cast<int>(stock.rows()); }
inline int stockHeight(const StockGrid& stock) { return static_cast<int>(stock.cols()); }
inline int stockArea(const StockGrid& stock) { return static_cast<int>(stock.size()); }

inline int occupiedCells(const StockGrid& stock) {
    return static_cast<int>((stock.array() != kEmptyCell).count());
}

inline bool isStockEmpty(const StockGrid& stock) { return occupiedCells(stock) == 0; }

inline StockGrid makeEmptyStock(int width, int height) {
    return StockGrid::Constant(width, height, kEmptyCell);
}

float stockFillRatio(const StockGrid& stock);

int usedStockCount(const Observation& obs);

// Total remaining quantity over all product entries
int remainingDemand(const Observation& obs);

/**
 * @brief Filled ratio restricted to stocks that carry any material
 *
 * Untouched stocks are excluded from both numerator and denominator.
 * Returns 0 when no stock is in use.
 */
float correctedFilledRatio(const Observation& obs);

#endif // CUTTINGTYPES_H
