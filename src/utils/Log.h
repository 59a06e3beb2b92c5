// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for the DmxLink engine
 *
 * Consistent, coloured logging with timestamps and component tags.
 * The engine keeps no process-wide logger: a LogSink is constructed by the
 * application and handed to every component, which derives a tagged Logger.
 *
 * Usage:
 *   LogSink sink(LogLevel::Info);
 *   Logger log(sink, "Scheduler");
 *
 *   log.info("Started at %u Hz", rateHz);
 *   log.error("Write failed: %s (errno=%d)", msg, err);
 *
 * Output format:
 *   [12345][INFO][Scheduler] Started at 30 Hz
 *   [12346][ERROR][Transport] Write failed: EIO (errno=5)
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define DMX_ANSI_RESET      "\033[0m"
#define DMX_ANSI_BOLD       "\033[1m"

#define DMX_CLR_GREEN       "\033[1;32m"   // Info, connection up
#define DMX_CLR_YELLOW      "\033[1;33m"   // Serial/hardware diagnostics
#define DMX_CLR_CYAN        "\033[1;36m"   // Frame statistics
#define DMX_CLR_RED         "\033[1;31m"   // Errors
#define DMX_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define DMX_CLR_GRAY        "\033[0;37m"   // Debug (dim)

// Semantic aliases for log levels
#define DMX_CLR_ERROR       DMX_CLR_RED
#define DMX_CLR_WARN        DMX_CLR_MAGENTA
#define DMX_CLR_INFO        DMX_CLR_GREEN
#define DMX_CLR_DEBUG       DMX_CLR_GRAY

#if defined(__GNUC__)
#define DMX_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define DMX_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace dmxlink {
namespace utils {

// ============================================================================
// Log Levels
// ============================================================================
// 0=None, 1=Error, 2=Warn, 3=Info, 4=Debug
// Default: INFO (WARN when built with NDEBUG)

enum class LogLevel : uint8_t {
    None  = 0,
    Error = 1,
    Warn  = 2,
    Info  = 3,
    Debug = 4
};

#ifdef NDEBUG
constexpr LogLevel DEFAULT_LOG_LEVEL = LogLevel::Warn;
#else
constexpr LogLevel DEFAULT_LOG_LEVEL = LogLevel::Info;
#endif

/**
 * @brief Name used in the level column ("ERROR", "WARN", ...)
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive: none/error/warn/info/debug)
 * @return true if the name was recognised
 */
bool parseLogLevel(const char* name, LogLevel& outLevel);

/**
 * @brief Shared output for every Logger derived from it
 *
 * Thread-safe: lines from different threads are never interleaved.
 * Timestamps are milliseconds since the sink was constructed.
 */
class LogSink {
public:
    /// Receives every emitted line (without colour codes) when installed
    using CaptureFn = std::function<void(LogLevel level, const std::string& tag, const std::string& message)>;

    explicit LogSink(LogLevel level = DEFAULT_LOG_LEVEL, FILE* out = stderr, bool color = true);

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isEnabled(LogLevel level) const;

    void setColor(bool enabled);

    /**
     * @brief Install a capture callback (tests, UI log panes)
     *
     * When a capture is installed the line is still written to the output
     * stream unless @p mirrorToStream is false.
     */
    void setCapture(CaptureFn capture, bool mirrorToStream = false);

    /**
     * @brief Format and emit one line
     */
    void write(LogLevel level, const char* tag, const char* fmt, va_list args);

    /**
     * @brief Milliseconds since construction
     */
    uint32_t millis() const;

private:
    mutable std::mutex m_mutex;
    LogLevel m_level;
    FILE* m_out;
    bool m_color;
    bool m_mirror;
    CaptureFn m_capture;
    std::chrono::steady_clock::time_point m_epoch;
};

/**
 * @brief Tagged front-end onto a LogSink
 *
 * Cheap to copy. The referenced sink must outlive the logger.
 */
class Logger {
public:
    Logger(LogSink& sink, const char* tag)
        : m_sink(&sink)
        , m_tag(tag) {}

    void error(const char* fmt, ...) const DMX_PRINTF_FORMAT(2, 3);
    void warn(const char* fmt, ...) const DMX_PRINTF_FORMAT(2, 3);
    void info(const char* fmt, ...) const DMX_PRINTF_FORMAT(2, 3);
    void debug(const char* fmt, ...) const DMX_PRINTF_FORMAT(2, 3);

    bool isEnabled(LogLevel level) const { return m_sink->isEnabled(level); }
    const char* getTag() const { return m_tag; }
    LogSink& getSink() const { return *m_sink; }

private:
    LogSink* m_sink;
    const char* m_tag;
};

} // namespace utils
} // namespace dmxlink
