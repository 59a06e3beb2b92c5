// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - ErrorHistory Unit Tests
 */

#include <unity.h>
#include <string>

#include "../../src/core/errors/ErrorHistory.h"

using namespace dmxlink;
using namespace dmxlink::errors;

void test_errors_empty_history() {
    ErrorHistory history;
    ErrorStats stats = history.getStats();
    TEST_ASSERT_EQUAL_UINT32(0, stats.totalErrors);
    TEST_ASSERT_FALSE(stats.hasEntries);
    TEST_ASSERT_TRUE(stats.errorsByCode.empty());
}

void test_errors_success_not_recorded() {
    ErrorHistory history;
    history.record(Result::success());
    TEST_ASSERT_EQUAL_UINT32(0, history.getStats().totalErrors);
}

void test_errors_counts_by_code() {
    ErrorHistory history;
    history.record(Result::error(ErrorCode::SERIAL_CONNECTION, "first", "hint"));
    history.record(Result::error(ErrorCode::FRAME_SEND, "write"));
    history.record(Result::error(ErrorCode::SERIAL_CONNECTION, "last"));

    ErrorStats stats = history.getStats();
    TEST_ASSERT_EQUAL_UINT32(3, stats.totalErrors);
    TEST_ASSERT_EQUAL_UINT32(2, stats.errorsByCode[ErrorCode::SERIAL_CONNECTION]);
    TEST_ASSERT_EQUAL_UINT32(1, stats.errorsByCode[ErrorCode::FRAME_SEND]);
    TEST_ASSERT_TRUE(stats.hasEntries);
    TEST_ASSERT_EQUAL_STRING("first", stats.oldestError.message.c_str());
    TEST_ASSERT_EQUAL_STRING("hint", stats.oldestError.hint.c_str());
    TEST_ASSERT_EQUAL_STRING("last", stats.lastError.message.c_str());
}

void test_errors_bounded_to_max_entries() {
    ErrorHistory history;
    for (size_t i = 0; i < ErrorHistory::MAX_ENTRIES + 25; ++i) {
        history.record(Result::error(ErrorCode::FRAME_SEND, "e" + std::to_string(i)));
    }

    ErrorStats stats = history.getStats();
    TEST_ASSERT_EQUAL_UINT32(ErrorHistory::MAX_ENTRIES, stats.totalErrors);
    TEST_ASSERT_EQUAL_STRING("e25", stats.oldestError.message.c_str());
    TEST_ASSERT_EQUAL_STRING("e124", stats.lastError.message.c_str());
}

void test_errors_clear() {
    ErrorHistory history;
    history.record(Result::error(ErrorCode::TIMEOUT, "slow"));
    history.clear();
    TEST_ASSERT_FALSE(history.getStats().hasEntries);
}

void run_error_history_tests() {
    RUN_TEST(test_errors_empty_history);
    RUN_TEST(test_errors_success_not_recorded);
    RUN_TEST(test_errors_counts_by_code);
    RUN_TEST(test_errors_bounded_to_max_entries);
    RUN_TEST(test_errors_clear);
}
