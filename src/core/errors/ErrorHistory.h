// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "../Result.h"

namespace dmxlink {
namespace errors {

struct ErrorEntry {
    uint32_t timestampMs;       // ms since the history was created
    ErrorCode code;
    std::string message;
    std::string hint;

    ErrorEntry() : timestampMs(0), code(ErrorCode::NONE) {}
};

struct ErrorStats {
    uint32_t totalErrors;                       // Entries currently retained
    std::map<ErrorCode, uint32_t> errorsByCode; // Over retained entries
    bool hasEntries;
    ErrorEntry lastError;
    ErrorEntry oldestError;

    ErrorStats() : totalErrors(0), hasEntries(false) {}
};

/**
 * Bounded log of engine errors (most recent MAX_ENTRIES kept)
 */
class ErrorHistory {
public:
    static constexpr size_t MAX_ENTRIES = 100;

    ErrorHistory();

    void record(const Result& error);
    ErrorStats getStats() const;
    void clear();

private:
    uint32_t nowMs() const;

    mutable std::mutex m_mutex;
    std::deque<ErrorEntry> m_entries;
    std::chrono::steady_clock::time_point m_epoch;
};

} // namespace errors
} // namespace dmxlink
