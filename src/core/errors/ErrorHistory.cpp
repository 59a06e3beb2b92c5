// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "ErrorHistory.h"

namespace dmxlink {
namespace errors {

ErrorHistory::ErrorHistory()
    : m_epoch(std::chrono::steady_clock::now())
{
}

void ErrorHistory::record(const Result& error) {
    if (error.isOk()) {
        return;
    }

    ErrorEntry entry;
    entry.timestampMs = nowMs();
    entry.code = error.code;
    entry.message = error.message;
    entry.hint = error.hint;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
    while (m_entries.size() > MAX_ENTRIES) {
        m_entries.pop_front();
    }
}

ErrorStats ErrorHistory::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    ErrorStats stats;
    stats.totalErrors = static_cast<uint32_t>(m_entries.size());
    for (const auto& entry : m_entries) {
        stats.errorsByCode[entry.code]++;
    }
    if (!m_entries.empty()) {
        stats.hasEntries = true;
        stats.lastError = m_entries.back();
        stats.oldestError = m_entries.front();
    }
    return stats;
}

void ErrorHistory::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

uint32_t ErrorHistory::nowMs() const {
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_epoch).count());
}

} // namespace errors
} // namespace dmxlink
