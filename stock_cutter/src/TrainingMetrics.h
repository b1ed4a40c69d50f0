#ifndef TRAININGMETRICS_H
#define TRAININGMETRICS_H

#include "CuttingTypes.h"
#include <deque>
#include <vector>

struct EpisodeRecord {
    int episode = 0;
    float filledRatio = 0.0f;
    float totalReward = 0.0f;
};

struct PlacementQuality {
    int edgeContact = 0;        // 0-2: touches a vertical and/or horizontal stock edge
    bool isCorner = false;
    int pieceArea = 0;
    bool onLeadingEdge = false; // x == 0 or y == 0
};

/**
 * @brief Observational training statistics
 *
 * Best scores, bounded recent windows and per-episode history. Nothing
 * stored here is read back by the decision pipeline.
 */
class TrainingMetrics {
public:
    static constexpr std::size_t kWindowSize = 10;

    // Records a completed episode and refreshes the best scores
    void addEpisodeData(int episode, float filledRatio, float totalReward);

    /**
     * @brief Records an episode only if all demand in `finalObs` is met
     *
     * The episode number is the count of episodes recorded so far.
     * Returns true if the episode was recorded.
     */
    bool logEpisodeSummary(const Observation& finalObs, float filledRatio, float totalReward);

    // Classifies a placement and appends it to the edge / corner series
    PlacementQuality evaluatePlacement(const StockGrid& stock, const Placement& placement);

    void recordStep(float filledRatio, float reward);

    // Overwrites the newest filled-ratio window entry, if any
    void correctLastFilledRatio(float filledRatio);

    void recordInvalidAction() { ++m_invalidActions; }

    float bestFilledRatio() const { return m_bestFilledRatio; }
    float bestReward() const { return m_bestReward; }
    int bestEpisode() const { return m_bestEpisode; }
    int invalidActions() const { return m_invalidActions; }

    const std::vector<EpisodeRecord>& episodes() const { return m_episodes; }
    const std::vector<int>& edgeUtilization() const { return m_edgeUtilization; }
    const std::vector<int>& cornerPlacements() const { return m_cornerPlacements; }

    const std::deque<float>& recentFilledRatios() const { return m_recentFilled; }
    const std::deque<float>& recentWasteRatios() const { return m_recentWaste; }
    const std::deque<float>& recentRewards() const { return m_recentReward; }

    static float windowMean(const std::deque<float>& window);

private:
    static void pushBounded(std::deque<float>& window, float value);

    float m_bestFilledRatio = 0.0f;
    float m_bestReward = -1e30f;
    int m_bestEpisode = -1;
    int m_invalidActions = 0;

    std::vector<EpisodeRecord> m_episodes;
    std::vector<int> m_edgeUtilization;
    std::vector<int> m_cornerPlacements;

    std::deque<float> m_recentFilled;
    std::deque<float> m_recentWaste;
    std::deque<float> m_recentReward;
};

#endif // TRAININGMETRICS_H
