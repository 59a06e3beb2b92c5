// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - ChannelBuffer Unit Tests
 *
 * Tests for the universe state:
 * - Channel addressing (1-512) and range errors
 * - Value normalization (clamp, round, NaN)
 * - Batch writes and version counter
 * - Snapshot layout (start code + 512 slots)
 */

#include <unity.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <map>
#include <thread>

#include "../../src/core/buffer/ChannelBuffer.h"

using namespace dmxlink;
using namespace dmxlink::buffer;

//==============================================================================
// Single Channel
//==============================================================================

void test_buffer_starts_dark() {
    ChannelBuffer buffer;
    Frame frame = buffer.snapshot();
    TEST_ASSERT_EQUAL_UINT32(DMX_FRAME_SIZE, frame.size());
    TEST_ASSERT_EQUAL_HEX8(DMX_START_CODE, frame.startCode());
    TEST_ASSERT_TRUE(frame.isBlackout());
    TEST_ASSERT_EQUAL_UINT32(0, buffer.getVersion());
}

void test_buffer_set_channel_maps_to_offset() {
    ChannelBuffer buffer;
    TEST_ASSERT_TRUE(buffer.setChannel(1, 255).isOk());
    TEST_ASSERT_TRUE(buffer.setChannel(512, 7).isOk());

    Frame frame = buffer.snapshot();
    TEST_ASSERT_EQUAL_UINT8(0, frame.data()[0]);
    TEST_ASSERT_EQUAL_UINT8(255, frame.data()[1]);
    TEST_ASSERT_EQUAL_UINT8(7, frame.data()[512]);
    TEST_ASSERT_EQUAL_UINT8(255, frame.channel(1));
}

void test_buffer_out_of_range_rejected_unchanged() {
    ChannelBuffer buffer;
    TEST_ASSERT_TRUE(buffer.setChannel(10, 99).isOk());
    Frame before = buffer.snapshot();
    uint32_t version = buffer.getVersion();

    Result low = buffer.setChannel(0, 50);
    Result high = buffer.setChannel(513, 50);
    Result negative = buffer.setChannel(-4, 50);

    TEST_ASSERT_TRUE(low.code == ErrorCode::CHANNEL_RANGE);
    TEST_ASSERT_TRUE(high.code == ErrorCode::CHANNEL_RANGE);
    TEST_ASSERT_TRUE(negative.code == ErrorCode::CHANNEL_RANGE);
    TEST_ASSERT_EQUAL_STRING("Channel 513 out of range (1-512)", high.message.c_str());
    TEST_ASSERT_TRUE(before == buffer.snapshot());
    TEST_ASSERT_EQUAL_UINT32(version, buffer.getVersion());
}

void test_buffer_value_normalization() {
    TEST_ASSERT_EQUAL_UINT8(0, ChannelBuffer::normalizeValue(-10.0));
    TEST_ASSERT_EQUAL_UINT8(255, ChannelBuffer::normalizeValue(300.0));
    TEST_ASSERT_EQUAL_UINT8(128, ChannelBuffer::normalizeValue(127.6));
    TEST_ASSERT_EQUAL_UINT8(127, ChannelBuffer::normalizeValue(127.4));
    TEST_ASSERT_EQUAL_UINT8(0, ChannelBuffer::normalizeValue(std::numeric_limits<double>::quiet_NaN()));
    TEST_ASSERT_EQUAL_UINT8(255, ChannelBuffer::normalizeValue(std::numeric_limits<double>::infinity()));
}

void test_buffer_get_channel() {
    ChannelBuffer buffer;
    buffer.setChannel(42, 180.2);
    uint8_t value = 0;
    TEST_ASSERT_TRUE(buffer.getChannel(42, value).isOk());
    TEST_ASSERT_EQUAL_UINT8(180, value);

    value = 9;
    TEST_ASSERT_TRUE(buffer.getChannel(600, value).code == ErrorCode::CHANNEL_RANGE);
    TEST_ASSERT_EQUAL_UINT8(9, value);
}

//==============================================================================
// Batch / Blackout
//==============================================================================

void test_buffer_set_channels_snapshot() {
    ChannelBuffer buffer;
    std::map<int, double> values;
    values[1] = 10;
    values[2] = 20;
    ChannelBatchResult result = buffer.setChannels(values);

    TEST_ASSERT_TRUE(result.isOk());
    TEST_ASSERT_EQUAL_UINT16(2, result.applied);

    Frame frame = buffer.snapshot();
    TEST_ASSERT_EQUAL_UINT8(0, frame.data()[0]);
    TEST_ASSERT_EQUAL_UINT8(10, frame.data()[1]);
    TEST_ASSERT_EQUAL_UINT8(20, frame.data()[2]);
    for (size_t i = 3; i < frame.size(); ++i) {
        TEST_ASSERT_EQUAL_UINT8(0, frame.data()[i]);
    }
}

void test_buffer_set_channels_partial_reject() {
    ChannelBuffer buffer;
    std::map<int, double> values;
    values[0] = 1;
    values[5] = 55;
    values[700] = 1;
    ChannelBatchResult result = buffer.setChannels(values);

    TEST_ASSERT_FALSE(result.isOk());
    TEST_ASSERT_TRUE(result.status.code == ErrorCode::CHANNEL_RANGE);
    TEST_ASSERT_EQUAL_UINT16(1, result.applied);
    TEST_ASSERT_EQUAL_UINT32(2, result.rejected.size());
    TEST_ASSERT_EQUAL_INT(0, result.rejected[0]);
    TEST_ASSERT_EQUAL_INT(700, result.rejected[1]);
    TEST_ASSERT_EQUAL_UINT8(55, buffer.snapshot().channel(5));
}

void test_buffer_set_channels_bumps_version_once() {
    ChannelBuffer buffer;
    std::map<int, double> values;
    for (int ch = 1; ch <= 16; ++ch) {
        values[ch] = ch;
    }
    buffer.setChannels(values);
    TEST_ASSERT_EQUAL_UINT32(1, buffer.getVersion());

    std::map<int, double> allBad;
    allBad[1000] = 1;
    buffer.setChannels(allBad);
    TEST_ASSERT_EQUAL_UINT32(1, buffer.getVersion());
}

void test_buffer_blackout_zeroes_everything() {
    ChannelBuffer buffer;
    for (int ch = 1; ch <= DMX_CHANNEL_COUNT; ch += 7) {
        buffer.setChannel(ch, 200);
    }
    buffer.blackout();
    TEST_ASSERT_TRUE(buffer.snapshot().isBlackout());
    TEST_ASSERT_TRUE(buffer.snapshot() == Frame::blackout());
}

void test_buffer_batch_is_atomic_for_readers() {
    // A reader must never see half of a batch
    ChannelBuffer buffer;
    std::atomic<bool> torn(false);
    std::atomic<bool> done(false);

    std::thread reader([&] {
        while (!done.load()) {
            Frame f = buffer.snapshot();
            if (f.channel(1) != f.channel(512)) {
                torn = true;
            }
        }
    });

    for (int i = 0; i < 2000; ++i) {
        std::map<int, double> values;
        values[1] = i % 256;
        values[512] = i % 256;
        buffer.setChannels(values);
    }
    done = true;
    reader.join();

    TEST_ASSERT_FALSE(torn.load());
}

void run_channel_buffer_tests() {
    RUN_TEST(test_buffer_starts_dark);
    RUN_TEST(test_buffer_set_channel_maps_to_offset);
    RUN_TEST(test_buffer_out_of_range_rejected_unchanged);
    RUN_TEST(test_buffer_value_normalization);
    RUN_TEST(test_buffer_get_channel);
    RUN_TEST(test_buffer_set_channels_snapshot);
    RUN_TEST(test_buffer_set_channels_partial_reject);
    RUN_TEST(test_buffer_set_channels_bumps_version_once);
    RUN_TEST(test_buffer_blackout_zeroes_everything);
    RUN_TEST(test_buffer_batch_is_atomic_for_readers);
}
