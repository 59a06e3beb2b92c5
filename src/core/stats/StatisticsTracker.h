// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace dmxlink {
namespace stats {

/**
 * Point-in-time copy of the transmission counters
 */
struct Statistics {
    uint32_t fps;               ///< Frames transmitted in the last 1000 ms
    uint32_t frameCount;        ///< Frames transmitted since the last reset
    uint32_t dropCount;         ///< Ticks skipped because a send was in flight
    uint32_t sendFailures;      ///< Failed sendFrame() calls since the last reset
    uint32_t lastFrameAtMs;     ///< Age reference: ms since tracker creation of the last frame
    bool hasFrame;              ///< False until the first frame after a reset
    bool connected;             ///< Filled in by ConnectionManager

    Statistics()
        : fps(0), frameCount(0), dropCount(0), sendFailures(0)
        , lastFrameAtMs(0), hasFrame(false), connected(false) {}
};

/**
 * Frame-rate and drop accounting for the scheduler
 *
 * Counters only increase between resets. fps is the number of frames
 * whose completion falls inside the trailing one-second window, so it
 * reads 0 again one second after transmission stops.
 */
class StatisticsTracker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr uint32_t FPS_WINDOW_MS = 1000;

    StatisticsTracker();

    void recordFrame();
    void recordFrameAt(Clock::time_point when);
    void recordDrop(uint32_t count = 1);
    void recordSendFailure();

    /**
     * Zero every counter (called on each successful connect)
     */
    void reset();

    Statistics snapshot() const;
    Statistics snapshotAt(Clock::time_point now) const;

private:
    void pruneLocked(Clock::time_point now) const;

    mutable std::mutex m_mutex;
    mutable std::deque<Clock::time_point> m_window;
    uint32_t m_frameCount;
    uint32_t m_dropCount;
    uint32_t m_sendFailures;
    Clock::time_point m_lastFrameAt;
    bool m_hasFrame;
    Clock::time_point m_epoch;
};

} // namespace stats
} // namespace dmxlink
