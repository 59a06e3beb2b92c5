// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Result.h
 * @brief Error taxonomy and result type shared by every engine component
 *
 * Nothing in the engine throws. Fallible operations return a Result which is
 * either success() or carries an ErrorCode, a human-readable message and,
 * for serial failures, an actionable hint for the operator.
 *
 * Usage:
 *   Result r = buffer.setChannel(513, 10);
 *   if (!r.isOk()) {
 *       log.warn("%s: %s", errorCodeName(r.code), r.message.c_str());
 *   }
 */

#pragma once

#include <cstdint>
#include <string>

namespace dmxlink {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
    NONE              = 0,
    CONFIGURATION     = 1,   // Invalid options; fails fast, never retried
    CHANNEL_RANGE     = 2,   // Channel address outside [1,512]
    SERIAL_CONNECTION = 3,   // Port open/configure failure (carries a hint)
    FRAME_SEND        = 4,   // Write/break failure on an open port
    NOT_CONNECTED     = 5,   // Operation requires an open link
    TIMEOUT           = 6,   // Bounded wait elapsed
    CANCELLED         = 7    // Superseded by disconnect() or a fresh connect()
};

/**
 * @brief Stable name for an error code ("SERIAL_CONNECTION", ...)
 */
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::CONFIGURATION:     return "CONFIGURATION";
        case ErrorCode::CHANNEL_RANGE:     return "CHANNEL_RANGE";
        case ErrorCode::SERIAL_CONNECTION: return "SERIAL_CONNECTION";
        case ErrorCode::FRAME_SEND:        return "FRAME_SEND";
        case ErrorCode::NOT_CONNECTED:     return "NOT_CONNECTED";
        case ErrorCode::TIMEOUT:           return "TIMEOUT";
        case ErrorCode::CANCELLED:         return "CANCELLED";
        default:                           return "UNKNOWN";
    }
}

// ============================================================================
// Result
// ============================================================================

struct Result {
    ErrorCode code;
    std::string message;
    std::string hint;       // Operator guidance, empty when none applies

    Result() : code(ErrorCode::NONE) {}

    bool isOk() const { return code == ErrorCode::NONE; }

    static Result success() {
        return Result();
    }

    static Result error(ErrorCode c, const std::string& msg, const std::string& hintText = std::string()) {
        Result r;
        r.code = c;
        r.message = msg;
        r.hint = hintText;
        return r;
    }
};

} // namespace dmxlink
