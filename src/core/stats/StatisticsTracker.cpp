// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "StatisticsTracker.h"

namespace dmxlink {
namespace stats {

StatisticsTracker::StatisticsTracker()
    : m_frameCount(0)
    , m_dropCount(0)
    , m_sendFailures(0)
    , m_hasFrame(false)
    , m_epoch(Clock::now())
{
}

void StatisticsTracker::recordFrame() {
    recordFrameAt(Clock::now());
}

void StatisticsTracker::recordFrameAt(Clock::time_point when) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frameCount++;
    m_lastFrameAt = when;
    m_hasFrame = true;
    m_window.push_back(when);
    pruneLocked(when);
}

void StatisticsTracker::recordDrop(uint32_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_dropCount += count;
}

void StatisticsTracker::recordSendFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sendFailures++;
}

void StatisticsTracker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_window.clear();
    m_frameCount = 0;
    m_dropCount = 0;
    m_sendFailures = 0;
    m_hasFrame = false;
}

Statistics StatisticsTracker::snapshot() const {
    return snapshotAt(Clock::now());
}

Statistics StatisticsTracker::snapshotAt(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneLocked(now);

    Statistics s;
    s.fps = static_cast<uint32_t>(m_window.size());
    s.frameCount = m_frameCount;
    s.dropCount = m_dropCount;
    s.sendFailures = m_sendFailures;
    s.hasFrame = m_hasFrame;
    if (m_hasFrame) {
        s.lastFrameAtMs = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(m_lastFrameAt - m_epoch).count());
    }
    return s;
}

void StatisticsTracker::pruneLocked(Clock::time_point now) const {
    const auto window = std::chrono::milliseconds(FPS_WINDOW_MS);
    while (!m_window.empty() && now - m_window.front() >= window) {
        m_window.pop_front();
    }
}

} // namespace stats
} // namespace dmxlink
