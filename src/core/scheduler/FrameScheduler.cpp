// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "FrameScheduler.h"

#include <cstdio>

namespace dmxlink {
namespace scheduler {

namespace {

actors::ActorConfig schedulerConfig() {
    return actors::ActorConfig(
        "Scheduler",                            // name
        8,                                      // queueSize
        framePeriodMs(DEFAULT_FRAME_RATE_HZ),   // tickIntervalMs
        1000                                    // stopTimeoutMs
    );
}

} // namespace

FrameScheduler::FrameScheduler(buffer::ChannelBuffer& buffer,
                               hal::ISerialTransport& transport,
                               stats::StatisticsTracker& stats,
                               utils::LogSink& logSink)
    : actors::Actor(schedulerConfig(), logSink)
    , m_buffer(buffer)
    , m_transport(transport)
    , m_stats(stats)
    , m_frameRateHz(DEFAULT_FRAME_RATE_HZ)
    , m_linkActive(false)
    , m_listener(nullptr)
    , m_consecutiveFailures(0)
{
}

FrameScheduler::~FrameScheduler() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result FrameScheduler::start(uint32_t frameRateHz) {
    if (!isValidFrameRate(frameRateHz)) {
        char msg[96];
        snprintf(msg, sizeof(msg), "Frame rate %lu Hz outside %lu-%lu Hz",
                 (unsigned long)frameRateHz, (unsigned long)MIN_FRAME_RATE_HZ,
                 (unsigned long)MAX_FRAME_RATE_HZ);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }

    if (isRunning()) {
        log().debug("start() ignored, already running at %lu Hz", (unsigned long)m_frameRateHz.load());
        return Result::success();
    }

    m_frameRateHz = frameRateHz;
    setTickInterval(framePeriodMs(frameRateHz));

    if (!actors::Actor::start()) {
        return Result::error(ErrorCode::CONFIGURATION, "Scheduler thread could not be started");
    }
    return Result::success();
}

void FrameScheduler::stop() {
    actors::Actor::stop();
}

Result FrameScheduler::setFrameRate(uint32_t frameRateHz) {
    if (!isValidFrameRate(frameRateHz)) {
        char msg[96];
        snprintf(msg, sizeof(msg), "Frame rate %lu Hz outside %lu-%lu Hz",
                 (unsigned long)frameRateHz, (unsigned long)MIN_FRAME_RATE_HZ,
                 (unsigned long)MAX_FRAME_RATE_HZ);
        return Result::error(ErrorCode::CONFIGURATION, msg);
    }
    m_frameRateHz = frameRateHz;
    setTickInterval(framePeriodMs(frameRateHz));
    log().info("Frame rate set to %lu Hz (period %lu ms)",
               (unsigned long)frameRateHz, (unsigned long)framePeriodMs(frameRateHz));
    return Result::success();
}

// ============================================================================
// Actor Hooks
// ============================================================================

void FrameScheduler::onStart() {
    m_consecutiveFailures = 0;
    log().info("Started at %lu Hz (period %lu ms) on %s",
               (unsigned long)m_frameRateHz.load(), (unsigned long)getTickInterval(),
               m_transport.getName().c_str());
}

void FrameScheduler::onTick() {
    if (!m_linkActive.load()) {
        return;
    }

    Frame frame = m_buffer.snapshot();
    Result result = m_transport.sendFrame(frame);
    IFrameListener* listener = m_listener.load();

    if (result.isOk()) {
        m_stats.recordFrame();
        m_consecutiveFailures = 0;
        if (listener != nullptr) {
            listener->onFrameSent(frame);
        }
        return;
    }

    m_stats.recordSendFailure();
    m_consecutiveFailures++;
    if (m_consecutiveFailures == 1) {
        log().warn("sendFrame failed: %s", result.message.c_str());
    } else {
        log().debug("sendFrame failed (%lu in a row): %s",
                    (unsigned long)m_consecutiveFailures, result.message.c_str());
    }
    if (listener != nullptr) {
        listener->onSendFailed(result);
    }
}

void FrameScheduler::onMissedTicks(uint32_t count) {
    if (!m_linkActive.load()) {
        return;
    }
    m_stats.recordDrop(count);
    log().debug("Dropped %lu frame(s): send still in flight at deadline", (unsigned long)count);
}

void FrameScheduler::onStop() {
    log().info("Stopped");
}

} // namespace scheduler
} // namespace dmxlink
