// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FrameScheduler.h
 * @brief Periodic DMX frame transmission
 *
 * The FrameScheduler is a ticking Actor. Every tick it snapshots the
 * ChannelBuffer and hands the frame to the transport on its own thread, so
 * exactly one sendFrame() can be in flight. Deadlines that pass while a
 * send is still running are counted as dropped frames rather than queued.
 *
 * Per tick:
 *   1. Link inactive (not connected / degraded) -> skip silently
 *   2. Snapshot buffer, sendFrame()
 *   3. Success -> StatisticsTracker::recordFrame(), listener->onFrameSent()
 *      Failure -> listener->onSendFailed()
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "../actors/Actor.h"
#include "../buffer/ChannelBuffer.h"
#include "../stats/StatisticsTracker.h"
#include "../../hal/interface/ISerialTransport.h"

namespace dmxlink {
namespace scheduler {

constexpr uint32_t MIN_FRAME_RATE_HZ = 1;
constexpr uint32_t MAX_FRAME_RATE_HZ = 44;     // DMX512 maximum refresh for a full universe
constexpr uint32_t DEFAULT_FRAME_RATE_HZ = 30;

/**
 * @brief Tick period for a frame rate, rounded up so the rate is never exceeded
 */
inline uint32_t framePeriodMs(uint32_t frameRateHz) {
    return (1000 + frameRateHz - 1) / frameRateHz;
}

inline bool isValidFrameRate(uint32_t frameRateHz) {
    return frameRateHz >= MIN_FRAME_RATE_HZ && frameRateHz <= MAX_FRAME_RATE_HZ;
}

/**
 * @brief Receives transmission outcomes on the scheduler thread
 *
 * Implementations must return quickly and must not call
 * FrameScheduler::stop() synchronously.
 */
class IFrameListener {
public:
    virtual ~IFrameListener() = default;
    virtual void onFrameSent(const Frame& frame) = 0;
    virtual void onSendFailed(const Result& error) = 0;
};

class FrameScheduler : public actors::Actor {
public:
    FrameScheduler(buffer::ChannelBuffer& buffer,
                   hal::ISerialTransport& transport,
                   stats::StatisticsTracker& stats,
                   utils::LogSink& logSink);
    ~FrameScheduler() override;

    /**
     * @brief Begin periodic transmission
     *
     * No-op (success) if already running.
     * @return CONFIGURATION error if the rate is outside 1-44 Hz
     */
    Result start(uint32_t frameRateHz);

    /**
     * @brief Cancel pending ticks and wait for an in-flight send
     *
     * Once this returns no further sendFrame() is issued.
     */
    void stop();

    /**
     * @brief Retime a running (or stopped) scheduler without restarting it
     */
    Result setFrameRate(uint32_t frameRateHz);

    uint32_t getFrameRate() const { return m_frameRateHz.load(); }

    /**
     * @brief Gate transmission without stopping the thread
     *
     * Ticks while inactive are skipped and not counted as drops.
     */
    void setLinkActive(bool active) { m_linkActive = active; }
    bool isLinkActive() const { return m_linkActive.load(); }

    /**
     * @brief Install the outcome listener (call before start())
     */
    void setListener(IFrameListener* listener) { m_listener = listener; }

protected:
    void onStart() override;
    void onTick() override;
    void onMissedTicks(uint32_t count) override;
    void onStop() override;

private:
    buffer::ChannelBuffer& m_buffer;
    hal::ISerialTransport& m_transport;
    stats::StatisticsTracker& m_stats;

    std::atomic<uint32_t> m_frameRateHz;
    std::atomic<bool> m_linkActive;
    std::atomic<IFrameListener*> m_listener;

    uint32_t m_consecutiveFailures;     // Scheduler thread only
};

} // namespace scheduler
} // namespace dmxlink
