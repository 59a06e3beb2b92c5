// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - Logging Unit Tests
 *
 * Level filtering, level names and the capture hook used by other suites.
 */

#include <unity.h>
#include <string>
#include <vector>

#include "../../src/utils/Log.h"

using namespace dmxlink::utils;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string tag;
    std::string message;
};

} // namespace

//==============================================================================
// Level Names
//==============================================================================

void test_log_parse_level_case_insensitive() {
    LogLevel level = LogLevel::None;
    TEST_ASSERT_TRUE(parseLogLevel("debug", level));
    TEST_ASSERT_TRUE(level == LogLevel::Debug);
    TEST_ASSERT_TRUE(parseLogLevel("ERROR", level));
    TEST_ASSERT_TRUE(level == LogLevel::Error);
    TEST_ASSERT_TRUE(parseLogLevel("Warning", level));
    TEST_ASSERT_TRUE(level == LogLevel::Warn);
}

void test_log_parse_level_rejects_unknown() {
    LogLevel level = LogLevel::Info;
    TEST_ASSERT_FALSE(parseLogLevel("verbose", level));
    TEST_ASSERT_FALSE(parseLogLevel(nullptr, level));
    TEST_ASSERT_TRUE(level == LogLevel::Info);
}

void test_log_level_names() {
    TEST_ASSERT_EQUAL_STRING("ERROR", logLevelName(LogLevel::Error));
    TEST_ASSERT_EQUAL_STRING("INFO", logLevelName(LogLevel::Info));
    TEST_ASSERT_EQUAL_STRING("NONE", logLevelName(LogLevel::None));
}

//==============================================================================
// Sink Filtering / Capture
//==============================================================================

void test_log_filters_below_level() {
    LogSink sink(LogLevel::Warn, nullptr, false);
    std::vector<CapturedLine> lines;
    sink.setCapture([&](LogLevel level, const std::string& tag, const std::string& msg) {
        lines.push_back(CapturedLine{level, tag, msg});
    });

    Logger log(sink, "Test");
    log.debug("hidden %d", 1);
    log.info("hidden %d", 2);
    log.warn("shown %d", 3);
    log.error("shown %d", 4);

    TEST_ASSERT_EQUAL_UINT32(2, lines.size());
    TEST_ASSERT_TRUE(lines[0].level == LogLevel::Warn);
    TEST_ASSERT_EQUAL_STRING("Test", lines[0].tag.c_str());
    TEST_ASSERT_EQUAL_STRING("shown 3", lines[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("shown 4", lines[1].message.c_str());
}

void test_log_level_none_disables_everything() {
    LogSink sink(LogLevel::None, nullptr, false);
    int calls = 0;
    sink.setCapture([&](LogLevel, const std::string&, const std::string&) { calls++; });

    Logger log(sink, "Quiet");
    log.error("nothing");
    TEST_ASSERT_EQUAL_INT(0, calls);
    TEST_ASSERT_FALSE(log.isEnabled(LogLevel::Error));
}

void test_log_set_level_at_runtime() {
    LogSink sink(LogLevel::Error, nullptr, false);
    TEST_ASSERT_FALSE(sink.isEnabled(LogLevel::Debug));
    sink.setLevel(LogLevel::Debug);
    TEST_ASSERT_TRUE(sink.isEnabled(LogLevel::Debug));
    TEST_ASSERT_TRUE(sink.getLevel() == LogLevel::Debug);
}

void run_log_tests() {
    RUN_TEST(test_log_parse_level_case_insensitive);
    RUN_TEST(test_log_parse_level_rejects_unknown);
    RUN_TEST(test_log_level_names);
    RUN_TEST(test_log_filters_below_level);
    RUN_TEST(test_log_level_none_disables_everything);
    RUN_TEST(test_log_set_level_at_runtime);
}
