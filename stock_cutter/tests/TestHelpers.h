#ifndef TESTHELPERS_H
#define TESTHELPERS_H

#include "CuttingTypes.h"
#include <vector>

namespace testing_helpers {

// Tags the rectangle (x, y, w, h) with `id`
void fillBlock(StockGrid& stock, int x, int y, int w, int h, int id = 0);

StockGrid stockWithBlock(int width, int height, int x, int y, int w, int h, int id = 0);

Observation makeObservation(std::vector<StockGrid> stocks, std::vector<ProductDemand> products);

// True iff every cell of the placement is inside the stock and empty
bool placementIsFree(const Observation& obs, const Placement& placement);

} // namespace testing_helpers

#endif // TESTHELPERS_H
