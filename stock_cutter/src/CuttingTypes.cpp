#include "CuttingTypes.h"

float stockFillRatio(const StockGrid& stock) {
    if (stock.size() == 0) return 0.0f;
    return static_cast<float>(occupiedCells(stock)) / static_cast<float>(stockArea(stock));
}

int usedStockCount(const Observation& obs) {
    int used = 0;
    for (const auto& stock : obs.stocks) {
        if (!isStockEmpty(stock)) ++used;
    }
    return used;
}

int remainingDemand(const Observation& obs) {
    int total = 0;
    for (const auto& product : obs.products) {
        total += product.quantity;
    }
    return total;
}

float correctedFilledRatio(const Observation& obs) {
    long usedArea = 0;
    long totalArea = 0;

    for (const auto& stock : obs.stocks) {
        int occupied = occupiedCells(stock);
        if (occupied == 0) continue;
        usedArea += occupied;
        totalArea += stockArea(stock);
    }

    if (totalArea == 0) return 0.0f;
    return static_cast<float>(usedArea) / static_cast<float>(totalArea);
}
