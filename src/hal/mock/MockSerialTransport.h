// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MockSerialTransport.h
 * @brief In-memory DMX device for tests and hardware-free runs
 *
 * Behaves like a port with an attached fixture: frames that pass the
 * start-code check update a simulated 512-channel device state. Latency and
 * failures can be injected, and every open attempt and frame is recorded
 * with a monotonic timestamp so tests can assert on timing and overlap.
 */

#pragma once

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "../interface/ISerialTransport.h"
#include "../../utils/Log.h"

namespace dmxlink {
namespace hal {

/**
 * @brief Fault and latency injection for the mock
 */
struct MockTransportOptions {
    uint32_t openDelayMs = 0;           ///< Latency of every open()
    uint32_t sendDelayMs = 0;           ///< Latency of every sendFrame()
    uint32_t failOpenCount = 0;         ///< Fail this many open() calls, then succeed
    bool alwaysFailOpen = false;        ///< Every open() fails
    int openErrno = ENOENT;             ///< errno reported by failing opens
    uint32_t frameCapacity = 2048;      ///< Captured frames kept (oldest evicted)
};

/**
 * @brief One captured transmission
 */
struct CapturedFrame {
    Frame frame;
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point finishedAt;
};

class MockSerialTransport : public ISerialTransport {
public:
    using Clock = std::chrono::steady_clock;

    MockSerialTransport(utils::LogSink& logSink, const MockTransportOptions& options = MockTransportOptions());
    ~MockSerialTransport() override = default;

    // ISerialTransport
    Result open(const SerialOptions& options) override;
    Result sendFrame(const Frame& frame) override;
    Result close() override;
    bool isOpen() const override { return m_open.load(); }
    std::string getName() const override { return "mock"; }
    TransportStats getStats() const override;

    // ==================== Fault Injection ====================

    void setSendDelayMs(uint32_t ms) { m_sendDelayMs = ms; }
    void setOpenDelayMs(uint32_t ms) { m_openDelayMs = ms; }
    void setAlwaysFailOpen(bool fail) { m_alwaysFailOpen = fail; }
    void setFailOpenCount(uint32_t count) { m_failOpenRemaining = count; }

    /**
     * @brief Fail every sendFrame() until cleared
     */
    void setFailSends(bool fail) { m_failSends = fail; }

    /**
     * @brief Fail the next @p count sendFrame() calls
     */
    void failNextSends(uint32_t count) { m_failSendRemaining = count; }

    // ==================== Inspection ====================

    std::vector<CapturedFrame> getFrames() const;
    size_t getFrameCount() const;
    bool getLastFrame(Frame& out) const;
    void clearFrames();

    /**
     * @brief Timestamps of every open() call, successful or not
     */
    std::vector<Clock::time_point> getOpenAttempts() const;
    uint32_t getOpenAttemptCount() const;

    /**
     * @brief Number of sendFrame() calls that overlapped another in time
     */
    uint32_t getOverlapCount() const { return m_overlaps.load(); }
    uint32_t getMaxConcurrentSends() const { return m_maxConcurrent.load(); }

    uint32_t getCloseCount() const { return m_closeCount.load(); }

    /**
     * @brief Channel value held by the simulated fixture (1-based)
     */
    uint8_t getDeviceChannel(uint16_t channel) const;

    /**
     * @brief Options passed to the last successful open()
     */
    SerialOptions getLastOptions() const;

private:
    utils::Logger m_log;
    MockTransportOptions m_options;
    SerialOptions m_lastOptions;

    std::atomic<bool> m_open;
    std::atomic<uint32_t> m_openDelayMs;
    std::atomic<uint32_t> m_sendDelayMs;
    std::atomic<bool> m_alwaysFailOpen;
    std::atomic<uint32_t> m_failOpenRemaining;
    std::atomic<bool> m_failSends;
    std::atomic<uint32_t> m_failSendRemaining;

    std::atomic<int> m_inFlight;
    std::atomic<uint32_t> m_overlaps;
    std::atomic<uint32_t> m_maxConcurrent;
    std::atomic<uint32_t> m_closeCount;

    mutable std::mutex m_mutex;
    std::deque<CapturedFrame> m_frames;
    size_t m_totalFrames;
    std::vector<Clock::time_point> m_openAttempts;
    std::array<uint8_t, DMX_CHANNEL_COUNT> m_deviceChannels;
    TransportStats m_stats;
};

} // namespace hal
} // namespace dmxlink
