#ifndef REWARDSHAPER_H
#define REWARDSHAPER_H

#include "CuttingTypes.h"

/**
 * @brief Per-term record of one shaped reward
 *
 * total() is the plain sum of the terms, so any recorded breakdown can be
 * re-added independently of the shaper.
 */
struct RewardBreakdown {
    bool missing = false;        // no placement was made
    float scatter = 0.0f;        // <= 0, placed away from existing material
    float adjacency = 0.0f;      // >= 0, touching existing material
    float topDown = 0.0f;        // <= 0, empty cells left above the piece
    float cornerEdge = 0.0f;     // 8 at the origin corner, 4 on the top or left edge
    float newStock = 0.0f;       // <= 0, small piece opening a fresh stock
    float utilization = 0.0f;    // 30 x change of the corrected filled ratio
    float isolation = 0.0f;      // <= 0, empty halo cells

    float total() const;
};

/**
 * @brief Scalar reward for a realized placement
 *
 * `before` is the observation the decision was made on, `after` the one
 * reported once the placement was applied. Whether the stock already held
 * material, and the scatter distance, are read from `before`. Halo based
 * terms and the new-stock test are read from `after`.
 */
class RewardShaper {
public:
    static constexpr float kMissingPlacementReward = -10.0f;

    RewardBreakdown evaluate(const Decision& decision,
                             const Observation& before,
                             const Observation& after) const;
};

#endif // REWARDSHAPER_H
