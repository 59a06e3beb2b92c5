// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "ChannelBuffer.h"

#include <cmath>
#include <cstdio>

namespace dmxlink {
namespace buffer {

ChannelBuffer::ChannelBuffer()
    : m_version(0)
{
    m_channels.fill(0);
}

// ==================== Command Methods ====================

Result ChannelBuffer::setChannel(int channel, double value) {
    if (!isValidChannel(channel)) {
        return rangeError(channel);
    }

    uint8_t normalized = normalizeValue(value);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels[channel - 1] = normalized;
    m_version++;
    return Result::success();
}

ChannelBatchResult ChannelBuffer::setChannels(const std::map<int, double>& values) {
    ChannelBatchResult result;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : values) {
            if (!isValidChannel(entry.first)) {
                result.rejected.push_back(entry.first);
                continue;
            }
            m_channels[entry.first - 1] = normalizeValue(entry.second);
            result.applied++;
        }
        if (result.applied > 0) {
            m_version++;
        }
    }

    if (!result.rejected.empty()) {
        // std::map iteration keeps `rejected` ascending
        char msg[128];
        snprintf(msg, sizeof(msg), "%u channel(s) outside 1-%u rejected (first: %d)",
                 (unsigned)result.rejected.size(), (unsigned)DMX_CHANNEL_COUNT, result.rejected.front());
        result.status = Result::error(ErrorCode::CHANNEL_RANGE, msg);
    }
    return result;
}

void ChannelBuffer::blackout() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_channels.fill(0);
    m_version++;
}

// ==================== Query Methods ====================

Frame ChannelBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return Frame(m_channels);
}

Result ChannelBuffer::getChannel(int channel, uint8_t& outValue) const {
    if (!isValidChannel(channel)) {
        return rangeError(channel);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    outValue = m_channels[channel - 1];
    return Result::success();
}

uint32_t ChannelBuffer::getVersion() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_version;
}

// ==================== Helpers ====================

uint8_t ChannelBuffer::normalizeValue(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    if (value <= 0.0) {
        return 0;
    }
    if (value >= 255.0) {
        return 255;
    }
    return static_cast<uint8_t>(std::lround(value));
}

Result ChannelBuffer::rangeError(int channel) {
    char msg[96];
    snprintf(msg, sizeof(msg), "Channel %d out of range (1-%u)", channel, (unsigned)DMX_CHANNEL_COUNT);
    return Result::error(ErrorCode::CHANNEL_RANGE, msg);
}

} // namespace buffer
} // namespace dmxlink
