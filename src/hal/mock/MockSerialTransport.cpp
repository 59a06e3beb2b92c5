// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "MockSerialTransport.h"

#include <thread>

namespace dmxlink {
namespace hal {

MockSerialTransport::MockSerialTransport(utils::LogSink& logSink, const MockTransportOptions& options)
    : m_log(logSink, "MockPort")
    , m_options(options)
    , m_open(false)
    , m_openDelayMs(options.openDelayMs)
    , m_sendDelayMs(options.sendDelayMs)
    , m_alwaysFailOpen(options.alwaysFailOpen)
    , m_failOpenRemaining(options.failOpenCount)
    , m_failSends(false)
    , m_failSendRemaining(0)
    , m_inFlight(0)
    , m_overlaps(0)
    , m_maxConcurrent(0)
    , m_closeCount(0)
    , m_totalFrames(0)
{
    m_deviceChannels.fill(0);
}

// ==================== ISerialTransport ====================

Result MockSerialTransport::open(const SerialOptions& options) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_openAttempts.push_back(Clock::now());
    }

    uint32_t delay = m_openDelayMs.load();
    if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    bool fail = m_alwaysFailOpen.load();
    if (!fail) {
        uint32_t remaining = m_failOpenRemaining.load();
        while (remaining > 0 && !m_failOpenRemaining.compare_exchange_weak(remaining, remaining - 1)) {
        }
        fail = remaining > 0;
    }

    if (fail) {
        m_log.debug("Simulated open failure for %s", options.portPath.c_str());
        return describeOpenError(m_options.openErrno, options.portPath.empty() ? "/dev/tty.mock" : options.portPath);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastOptions = options;
        m_stats.opens++;
    }
    m_open = true;
    m_log.info("Mock device open (%s)", options.portPath.empty() ? "/dev/tty.mock" : options.portPath.c_str());
    return Result::success();
}

Result MockSerialTransport::sendFrame(const Frame& frame) {
    if (!m_open.load()) {
        return Result::error(ErrorCode::NOT_CONNECTED, "Port is not open");
    }

    // Overlap detection: any concurrent caller is a scheduler bug
    int concurrent = ++m_inFlight;
    if (concurrent > 1) {
        m_overlaps++;
    }
    uint32_t seen = m_maxConcurrent.load();
    while (static_cast<uint32_t>(concurrent) > seen &&
           !m_maxConcurrent.compare_exchange_weak(seen, static_cast<uint32_t>(concurrent))) {
    }

    const Clock::time_point started = Clock::now();
    uint32_t delay = m_sendDelayMs.load();
    if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    bool fail = m_failSends.load();
    if (!fail) {
        uint32_t remaining = m_failSendRemaining.load();
        while (remaining > 0 && !m_failSendRemaining.compare_exchange_weak(remaining, remaining - 1)) {
        }
        fail = remaining > 0;
    }

    Result result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (fail) {
            m_stats.writeErrors++;
            result = Result::error(ErrorCode::FRAME_SEND, "Mock write failed");
        } else {
            CapturedFrame captured;
            captured.frame = frame;
            captured.startedAt = started;
            captured.finishedAt = Clock::now();
            m_frames.push_back(captured);
            while (m_frames.size() > m_options.frameCapacity) {
                m_frames.pop_front();
            }
            m_totalFrames++;

            // The fixture only latches frames carrying the dimmer start code
            if (frame.startCode() == DMX_START_CODE) {
                for (uint16_t ch = 1; ch <= DMX_CHANNEL_COUNT; ++ch) {
                    m_deviceChannels[ch - 1] = frame.channel(ch);
                }
            }
            m_stats.framesSent++;
            m_stats.lastSendUs = static_cast<uint32_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(captured.finishedAt - started).count());
        }
    }

    --m_inFlight;
    return result;
}

Result MockSerialTransport::close() {
    if (!m_open.exchange(false)) {
        return Result::success();
    }
    m_closeCount++;
    m_log.info("Mock device closed");
    return Result::success();
}

TransportStats MockSerialTransport::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

SerialOptions MockSerialTransport::getLastOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastOptions;
}

// ==================== Inspection ====================

std::vector<CapturedFrame> MockSerialTransport::getFrames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<CapturedFrame>(m_frames.begin(), m_frames.end());
}

size_t MockSerialTransport::getFrameCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalFrames;
}

bool MockSerialTransport::getLastFrame(Frame& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frames.empty()) {
        return false;
    }
    out = m_frames.back().frame;
    return true;
}

void MockSerialTransport::clearFrames() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frames.clear();
    m_totalFrames = 0;
}

std::vector<MockSerialTransport::Clock::time_point> MockSerialTransport::getOpenAttempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_openAttempts;
}

uint32_t MockSerialTransport::getOpenAttemptCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<uint32_t>(m_openAttempts.size());
}

uint8_t MockSerialTransport::getDeviceChannel(uint16_t channel) const {
    if (channel < 1 || channel > DMX_CHANNEL_COUNT) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_deviceChannels[channel - 1];
}

} // namespace hal
} // namespace dmxlink
