// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Frame.h
 * @brief Immutable DMX512 frame: start code followed by 512 channel slots
 *
 * Byte layout (513 bytes):
 *   [0]       start code (0x00 for dimmer data)
 *   [1..512]  channel 1..512
 *
 * A Frame is produced by ChannelBuffer::snapshot() and handed to the
 * transport as a unit. It is never modified after construction.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace dmxlink {

constexpr uint16_t DMX_CHANNEL_COUNT = 512;
constexpr uint16_t DMX_FRAME_SIZE = DMX_CHANNEL_COUNT + 1;
constexpr uint8_t DMX_START_CODE = 0x00;

class Frame {
public:
    using Bytes = std::array<uint8_t, DMX_FRAME_SIZE>;

    /**
     * @brief All-zero frame (blackout) with the standard start code
     */
    Frame() {
        m_bytes.fill(0);
        m_bytes[0] = DMX_START_CODE;
    }

    /**
     * @brief Build from 512 channel values; the start code is prepended
     */
    explicit Frame(const std::array<uint8_t, DMX_CHANNEL_COUNT>& channels, uint8_t startCode = DMX_START_CODE) {
        m_bytes[0] = startCode;
        for (size_t i = 0; i < DMX_CHANNEL_COUNT; ++i) {
            m_bytes[i + 1] = channels[i];
        }
    }

    static Frame blackout() { return Frame(); }

    const uint8_t* data() const { return m_bytes.data(); }
    size_t size() const { return m_bytes.size(); }
    uint8_t startCode() const { return m_bytes[0]; }

    /**
     * @brief Value of a 1-based channel; 0 for addresses outside [1,512]
     */
    uint8_t channel(uint16_t ch) const {
        if (ch < 1 || ch > DMX_CHANNEL_COUNT) {
            return 0;
        }
        return m_bytes[ch];
    }

    /**
     * @brief True when every channel slot is zero
     */
    bool isBlackout() const {
        for (size_t i = 1; i < m_bytes.size(); ++i) {
            if (m_bytes[i] != 0) {
                return false;
            }
        }
        return true;
    }

    const Bytes& bytes() const { return m_bytes; }

    bool operator==(const Frame& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    Bytes m_bytes;
};

} // namespace dmxlink
