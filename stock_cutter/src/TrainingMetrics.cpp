#include "TrainingMetrics.h"

void TrainingMetrics::addEpisodeData(int episode, float filledRatio, float totalReward) {
    m_episodes.push_back({episode, filledRatio, totalReward});

    if (filledRatio > m_bestFilledRatio) {
        m_bestFilledRatio = filledRatio;
    }
    if (totalReward > m_bestReward) {
        m_bestReward = totalReward;
        m_bestEpisode = episode;
    }
}

bool TrainingMetrics::logEpisodeSummary(const Observation& finalObs, float filledRatio, float totalReward) {
    if (remainingDemand(finalObs) != 0) return false;

    addEpisodeData(static_cast<int>(m_episodes.size()), filledRatio, totalReward);
    return true;
}

PlacementQuality TrainingMetrics::evaluatePlacement(const StockGrid& stock, const Placement& placement) {
    const int sw = stockWidth(stock);
    const int sh = stockHeight(stock);

    bool alongX = placement.x == 0 || placement.x + placement.width == sw;
    bool alongY = placement.y == 0 || placement.y + placement.height == sh;

    PlacementQuality quality;
    quality.edgeContact = (alongX ? 1 : 0) + (alongY ? 1 : 0);
    quality.isCorner = alongX && alongY;
    quality.pieceArea = placement.area();
    quality.onLeadingEdge = placement.x == 0 || placement.y == 0;

    m_edgeUtilization.push_back(quality.edgeContact);
    m_cornerPlacements.push_back(quality.isCorner ? 1 : 0);
    return quality;
}

void TrainingMetrics::recordStep(float filledRatio, float reward) {
    pushBounded(m_recentFilled, filledRatio);
    pushBounded(m_recentWaste, 1.0f - filledRatio);
    pushBounded(m_recentReward, reward);
}

void TrainingMetrics::correctLastFilledRatio(float filledRatio) {
    if (m_recentFilled.empty()) return;
    m_recentFilled.back() = filledRatio;
    m_recentWaste.back() = 1.0f - filledRatio;
}

float TrainingMetrics::windowMean(const std::deque<float>& window) {
    if (window.empty()) return 0.0f;
    float sum = 0.0f;
    for (float v : window) sum += v;
    return sum / static_cast<float>(window.size());
}

void TrainingMetrics::pushBounded(std::deque<float>& window, float value) {
    window.push_back(value);
    while (window.size() > kWindowSize) window.pop_front();
}
