// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - FrameScheduler Unit Tests
 *
 * Runs the scheduler against the in-memory transport:
 * - Frame period math and rate validation
 * - Frame content and refresh rate
 * - Slow transports: drops counted, sends never overlap
 * - Link gate, failures, stop, retiming
 */

#include <unity.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "../../src/core/buffer/ChannelBuffer.h"
#include "../../src/core/scheduler/FrameScheduler.h"
#include "../../src/core/stats/StatisticsTracker.h"
#include "../../src/hal/mock/MockSerialTransport.h"

using namespace dmxlink;
using namespace dmxlink::scheduler;

namespace {

void sleepMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

class CountingFrameListener : public IFrameListener {
public:
    CountingFrameListener() : sent(0), failed(0) {}
    void onFrameSent(const Frame&) override { sent++; }
    void onSendFailed(const Result&) override { failed++; }

    std::atomic<uint32_t> sent;
    std::atomic<uint32_t> failed;
};

/**
 * Buffer + stats + mock transport wired to one scheduler
 */
struct SchedulerRig {
    utils::LogSink sink;
    buffer::ChannelBuffer buffer;
    stats::StatisticsTracker stats;
    hal::MockSerialTransport transport;
    FrameScheduler scheduler;

    SchedulerRig()
        : sink(utils::LogLevel::None)
        , transport(sink)
        , scheduler(buffer, transport, stats, sink)
    {
        hal::SerialOptions options;
        options.portPath = "/dev/ttyMOCK0";
        transport.open(options);
        scheduler.setLinkActive(true);
    }
};

} // namespace

//==============================================================================
// Rate Math
//==============================================================================

void test_scheduler_frame_period_rounds_up() {
    TEST_ASSERT_EQUAL_UINT32(34, framePeriodMs(30));
    TEST_ASSERT_EQUAL_UINT32(23, framePeriodMs(44));
    TEST_ASSERT_EQUAL_UINT32(25, framePeriodMs(40));
    TEST_ASSERT_EQUAL_UINT32(1000, framePeriodMs(1));
}

void test_scheduler_rate_bounds() {
    TEST_ASSERT_FALSE(isValidFrameRate(0));
    TEST_ASSERT_TRUE(isValidFrameRate(1));
    TEST_ASSERT_TRUE(isValidFrameRate(44));
    TEST_ASSERT_FALSE(isValidFrameRate(45));
}

void test_scheduler_start_rejects_invalid_rate() {
    SchedulerRig rig;
    Result r = rig.scheduler.start(60);
    TEST_ASSERT_TRUE(r.code == ErrorCode::CONFIGURATION);
    TEST_ASSERT_FALSE(rig.scheduler.isRunning());
}

//==============================================================================
// Transmission
//==============================================================================

void test_scheduler_transmits_buffer_contents() {
    SchedulerRig rig;
    rig.buffer.setChannel(1, 255);

    TEST_ASSERT_TRUE(rig.scheduler.start(30).isOk());
    sleepMs(100);
    rig.scheduler.stop();

    std::vector<hal::CapturedFrame> frames = rig.transport.getFrames();
    TEST_ASSERT_TRUE(frames.size() >= 2);
    for (const auto& captured : frames) {
        TEST_ASSERT_EQUAL_UINT32(DMX_FRAME_SIZE, captured.frame.size());
        TEST_ASSERT_EQUAL_UINT8(0x00, captured.frame.data()[0]);
        TEST_ASSERT_EQUAL_UINT8(255, captured.frame.data()[1]);
    }
    TEST_ASSERT_EQUAL_UINT8(255, rig.transport.getDeviceChannel(1));
}

void test_scheduler_30hz_for_one_second() {
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.start(30).isOk());
    sleepMs(1000);
    rig.scheduler.stop();

    stats::Statistics s = rig.stats.snapshot();
    TEST_ASSERT_TRUE(s.frameCount >= 27);
    TEST_ASSERT_TRUE(s.frameCount <= 33);
    TEST_ASSERT_EQUAL_UINT32(s.frameCount, rig.transport.getFrameCount());
}

void test_scheduler_picks_up_changes_between_frames() {
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.start(44).isOk());
    rig.buffer.setChannel(100, 10);
    sleepMs(60);
    rig.buffer.setChannel(100, 20);
    sleepMs(60);
    rig.scheduler.stop();

    Frame last;
    TEST_ASSERT_TRUE(rig.transport.getLastFrame(last));
    TEST_ASSERT_EQUAL_UINT8(20, last.channel(100));
}

void test_scheduler_slow_sends_drop_without_overlap() {
    SchedulerRig rig;
    rig.transport.setSendDelayMs(2 * framePeriodMs(30));

    TEST_ASSERT_TRUE(rig.scheduler.start(30).isOk());
    sleepMs(500);
    rig.scheduler.stop();

    stats::Statistics s = rig.stats.snapshot();
    TEST_ASSERT_TRUE(s.dropCount >= 1);
    TEST_ASSERT_EQUAL_UINT32(0, rig.transport.getOverlapCount());
    TEST_ASSERT_EQUAL_UINT32(1, rig.transport.getMaxConcurrentSends());
}

void test_scheduler_inactive_link_sends_nothing() {
    SchedulerRig rig;
    rig.scheduler.setLinkActive(false);
    TEST_ASSERT_TRUE(rig.scheduler.start(44).isOk());
    sleepMs(100);
    rig.scheduler.stop();

    stats::Statistics s = rig.stats.snapshot();
    TEST_ASSERT_EQUAL_UINT32(0, rig.transport.getFrameCount());
    TEST_ASSERT_EQUAL_UINT32(0, s.frameCount);
    TEST_ASSERT_EQUAL_UINT32(0, s.dropCount);
}

void test_scheduler_reports_send_failures() {
    SchedulerRig rig;
    CountingFrameListener listener;
    rig.scheduler.setListener(&listener);
    rig.transport.failNextSends(3);

    TEST_ASSERT_TRUE(rig.scheduler.start(44).isOk());
    sleepMs(200);
    rig.scheduler.stop();
    rig.scheduler.setListener(nullptr);

    stats::Statistics s = rig.stats.snapshot();
    TEST_ASSERT_EQUAL_UINT32(3, s.sendFailures);
    TEST_ASSERT_EQUAL_UINT32(3, listener.failed.load());
    TEST_ASSERT_TRUE(listener.sent.load() >= 1);
    TEST_ASSERT_EQUAL_UINT32(listener.sent.load(), s.frameCount);
}

void test_scheduler_no_send_after_stop() {
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.start(44).isOk());
    sleepMs(80);
    rig.scheduler.stop();

    size_t count = rig.transport.getFrameCount();
    sleepMs(100);
    TEST_ASSERT_EQUAL_UINT32(count, rig.transport.getFrameCount());
    TEST_ASSERT_FALSE(rig.scheduler.isRunning());
}

void test_scheduler_set_frame_rate_while_running() {
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.start(10).isOk());
    sleepMs(50);
    TEST_ASSERT_TRUE(rig.scheduler.setFrameRate(40).isOk());
    rig.transport.clearFrames();
    sleepMs(500);
    rig.scheduler.stop();

    TEST_ASSERT_EQUAL_UINT32(40, rig.scheduler.getFrameRate());
    TEST_ASSERT_TRUE(rig.transport.getFrameCount() >= 14);
}

void test_scheduler_set_frame_rate_rejects_invalid() {
    SchedulerRig rig;
    TEST_ASSERT_TRUE(rig.scheduler.start(30).isOk());
    Result r = rig.scheduler.setFrameRate(0);
    rig.scheduler.stop();

    TEST_ASSERT_TRUE(r.code == ErrorCode::CONFIGURATION);
    TEST_ASSERT_EQUAL_UINT32(30, rig.scheduler.getFrameRate());
    TEST_ASSERT_EQUAL_UINT32(34, rig.scheduler.getTickInterval());
}

void run_frame_scheduler_tests() {
    RUN_TEST(test_scheduler_frame_period_rounds_up);
    RUN_TEST(test_scheduler_rate_bounds);
    RUN_TEST(test_scheduler_start_rejects_invalid_rate);
    RUN_TEST(test_scheduler_transmits_buffer_contents);
    RUN_TEST(test_scheduler_30hz_for_one_second);
    RUN_TEST(test_scheduler_picks_up_changes_between_frames);
    RUN_TEST(test_scheduler_slow_sends_drop_without_overlap);
    RUN_TEST(test_scheduler_inactive_link_sends_nothing);
    RUN_TEST(test_scheduler_reports_send_failures);
    RUN_TEST(test_scheduler_no_send_after_stop);
    RUN_TEST(test_scheduler_set_frame_rate_while_running);
    RUN_TEST(test_scheduler_set_frame_rate_rejects_invalid);
}
