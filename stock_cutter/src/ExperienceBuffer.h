#ifndef EXPERIENCEBUFFER_H
#define EXPERIENCEBUFFER_H

#include <Eigen/Core>
#include <optional>
#include <vector>

struct Experience {
    Eigen::VectorXf state;   // normalized encoding at decision time
    int action = 0;
    float reward = 0.0f;
    float value = 0.0f;      // critic estimate at decision time
    float logProb = 0.0f;    // log-probability of the sampled action
    bool done = false;
};

/**
 * @brief Ordered trajectory store for on-policy updates
 *
 * Records are appended in two phases. beginStep() opens a pending record
 * whose reward and terminal flag are not known yet; finalizePending()
 * closes it exactly once when the outcome is reported. Opening a new step
 * while one is still pending commits the old one with reward 0.
 */
class ExperienceBuffer {
public:
    void beginStep(Eigen::VectorXf state, int action, float value, float logProb);

    // Returns false when there is no pending record
    bool finalizePending(float reward, bool terminal);

    bool hasPending() const { return m_pending.has_value(); }
    void dropPending() { m_pending.reset(); }

    // Finalized records only
    int finalizedCount() const { return static_cast<int>(m_records.size()); }

    // Finalized records plus the pending one
    int size() const { return finalizedCount() + (hasPending() ? 1 : 0); }
    bool empty() const { return size() == 0; }

    const std::vector<Experience>& records() const { return m_records; }

    void clear();

private:
    std::vector<Experience> m_records;
    std::optional<Experience> m_pending;
};

#endif // EXPERIENCEBUFFER_H
