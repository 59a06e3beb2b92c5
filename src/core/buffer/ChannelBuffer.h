// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "../Frame.h"
#include "../Result.h"

namespace dmxlink {
namespace buffer {

/**
 * Outcome of a multi-channel write
 *
 * Entries are applied independently: a bad address never rolls back the
 * good ones. `status` is success only when every entry was applied.
 */
struct ChannelBatchResult {
    Result status;
    uint16_t applied;
    std::vector<int> rejected;      // Out-of-range channel addresses, ascending

    ChannelBatchResult() : applied(0) {}

    bool isOk() const { return status.isOk(); }
};

/**
 * Logical state of one DMX universe (512 channels)
 *
 * Architecture:
 * - Single array guarded by a narrow mutex; no I/O under the lock
 * - Writers are any caller thread; the scheduler is the only reader of
 *   full snapshots
 * - Version counter bumps on every successful mutation
 *
 * Value rule: input is rounded to the nearest integer and clamped to
 * [0,255]. NaN is written as 0. Channel addresses are 1-based.
 *
 * Usage:
 *   ChannelBuffer buffer;
 *   buffer.setChannel(1, 255);
 *   Frame frame = buffer.snapshot();   // frame.channel(1) == 255
 */
class ChannelBuffer {
public:
    ChannelBuffer();

    ChannelBuffer(const ChannelBuffer&) = delete;
    ChannelBuffer& operator=(const ChannelBuffer&) = delete;

    // ==================== Command Methods (Thread-Safe) ====================

    /**
     * Write one channel
     *
     * @param channel 1..512
     * @param value Any number; rounded and clamped to 0..255
     * @return CHANNEL_RANGE error if the address is invalid (buffer untouched)
     */
    Result setChannel(int channel, double value);

    /**
     * Write many channels under a single lock
     *
     * Invalid addresses are collected in the result; valid ones are applied.
     */
    ChannelBatchResult setChannels(const std::map<int, double>& values);

    /**
     * Set all 512 channels to zero. Never fails.
     */
    void blackout();

    // ==================== Query Methods ====================

    /**
     * Consistent copy of the whole universe with start code 0x00
     */
    Frame snapshot() const;

    /**
     * Read one channel back
     *
     * @param outValue Receives the current value when the address is valid
     */
    Result getChannel(int channel, uint8_t& outValue) const;

    /**
     * Number of successful mutations since construction
     */
    uint32_t getVersion() const;

    // ==================== Helpers ====================

    static bool isValidChannel(int channel) {
        return channel >= 1 && channel <= static_cast<int>(DMX_CHANNEL_COUNT);
    }

    /**
     * Round, clamp and NaN-filter a requested value
     */
    static uint8_t normalizeValue(double value);

private:
    static Result rangeError(int channel);

    mutable std::mutex m_mutex;
    std::array<uint8_t, DMX_CHANNEL_COUNT> m_channels;
    uint32_t m_version;
};

} // namespace buffer
} // namespace dmxlink
