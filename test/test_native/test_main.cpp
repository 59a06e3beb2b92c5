// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * DmxLink - Unity Test Runner
 *
 * Main entry point for native unit tests. Runs all test suites and
 * reports results.
 *
 * Build: cmake -S . -B build && cmake --build build
 * Run: ctest --test-dir build (or build/dmxlink_tests)
 */

#include <unity.h>
#include <cstdio>

// Test suite declarations
extern void run_log_tests();
extern void run_text_parse_tests();
extern void run_channel_buffer_tests();
extern void run_statistics_tests();
extern void run_actor_tests();
extern void run_frame_scheduler_tests();
extern void run_event_bus_tests();
extern void run_error_history_tests();
extern void run_serial_helper_tests();
extern void run_config_codec_tests();
extern void run_connection_manager_tests();

// Unity setUp/tearDown (required but can be empty)
void setUp(void) {
    // Called before each test
}

void tearDown(void) {
    // Called after each test
}

static void printSuiteHeader(const char* title) {
    printf("\n───────────────────────────────────────────────────────────────\n");
    printf("  %s\n", title);
    printf("───────────────────────────────────────────────────────────────\n");
}

/**
 * Main test runner
 *
 * Executes all test suites in sequence and reports aggregate results.
 */
int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    printf("\n");
    printf("═══════════════════════════════════════════════════════════════\n");
    printf("  DmxLink - Native Unit Test Suite\n");
    printf("═══════════════════════════════════════════════════════════════\n");

    UNITY_BEGIN();

    printSuiteHeader("Logging");
    run_log_tests();

    printSuiteHeader("Command Token Parsing");
    run_text_parse_tests();

    printSuiteHeader("Channel Buffer");
    run_channel_buffer_tests();

    printSuiteHeader("Statistics Tracker (FPS window, drops)");
    run_statistics_tests();

    printSuiteHeader("Actor Base (queue, ticks, shutdown)");
    run_actor_tests();

    printSuiteHeader("Frame Scheduler (timing, no overlap)");
    run_frame_scheduler_tests();

    printSuiteHeader("Event Bus (subscriptions)");
    run_event_bus_tests();

    printSuiteHeader("Error History");
    run_error_history_tests();

    printSuiteHeader("Serial Helpers (hints, parsing, port enumeration)");
    run_serial_helper_tests();

    printSuiteHeader("Engine Config Codec (ArduinoJson)");
    run_config_codec_tests();

    printSuiteHeader("Connection Manager (lifecycle, retry, reconnect)");
    run_connection_manager_tests();

    printf("\n═══════════════════════════════════════════════════════════════\n");
    int result = UNITY_END();
    printf("═══════════════════════════════════════════════════════════════\n");
    printf("\n");

    if (result == 0) {
        printf("✓ All tests passed!\n\n");
    } else {
        printf("✗ Some tests failed. See details above.\n\n");
    }

    return result;
}
