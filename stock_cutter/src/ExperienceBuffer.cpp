#include "ExperienceBuffer.h"
#include <utility>

void ExperienceBuffer::beginStep(Eigen::VectorXf state, int action, float value, float logProb) {
    if (m_pending) {
        m_records.push_back(std::move(*m_pending));
    }

    Experience exp;
    exp.state = std::move(state);
    exp.action = action;
    exp.value = value;
    exp.logProb = logProb;
    m_pending = std::move(exp);
}

bool ExperienceBuffer::finalizePending(float reward, bool terminal) {
    if (!m_pending) return false;

    m_pending->reward = reward;
    m_pending->done = terminal;
    m_records.push_back(std::move(*m_pending));
    m_pending.reset();
    return true;
}

void ExperienceBuffer::clear() {
    m_records.clear();
    m_pending.reset();
}
