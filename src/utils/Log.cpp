// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "Log.h"

#include <strings.h>

namespace dmxlink {
namespace utils {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::None:
        default:              return "NONE";
    }
}

bool parseLogLevel(const char* name, LogLevel& outLevel) {
    if (name == nullptr) {
        return false;
    }
    static const LogLevel levels[] = {
        LogLevel::None, LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug
    };
    for (LogLevel level : levels) {
        if (strcasecmp(name, logLevelName(level)) == 0) {
            outLevel = level;
            return true;
        }
    }
    // Accept "warning" as an alias
    if (strcasecmp(name, "warning") == 0) {
        outLevel = LogLevel::Warn;
        return true;
    }
    return false;
}

static const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return DMX_CLR_ERROR;
        case LogLevel::Warn:  return DMX_CLR_WARN;
        case LogLevel::Info:  return DMX_CLR_INFO;
        default:              return DMX_CLR_DEBUG;
    }
}

// ==================== LogSink ====================

LogSink::LogSink(LogLevel level, FILE* out, bool color)
    : m_level(level)
    , m_out(out)
    , m_color(color)
    , m_mirror(true)
    , m_epoch(std::chrono::steady_clock::now())
{
}

void LogSink::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

LogLevel LogSink::getLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_level;
}

bool LogSink::isEnabled(LogLevel level) const {
    if (level == LogLevel::None) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(m_level);
}

void LogSink::setColor(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_color = enabled;
}

void LogSink::setCapture(CaptureFn capture, bool mirrorToStream) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_capture = std::move(capture);
    m_mirror = m_capture ? mirrorToStream : true;
}

uint32_t LogSink::millis() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_epoch);
    return static_cast<uint32_t>(elapsed.count());
}

void LogSink::write(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }

    char message[512];
    vsnprintf(message, sizeof(message), fmt, args);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_capture) {
        m_capture(level, tag, message);
    }

    if (m_out != nullptr && m_mirror) {
        // [timestamp][LEVEL][TAG] message
        if (m_color) {
            fprintf(m_out, "[%lu]%s[%s]" DMX_ANSI_RESET "[%s] %s\n",
                    (unsigned long)millis(), levelColor(level), logLevelName(level), tag, message);
        } else {
            fprintf(m_out, "[%lu][%s][%s] %s\n",
                    (unsigned long)millis(), logLevelName(level), tag, message);
        }
        fflush(m_out);
    }
}

// ==================== Logger ====================

void Logger::error(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    m_sink->write(LogLevel::Error, m_tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    m_sink->write(LogLevel::Warn, m_tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    m_sink->write(LogLevel::Info, m_tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    m_sink->write(LogLevel::Debug, m_tag, fmt, args);
    va_end(args);
}

} // namespace utils
} // namespace dmxlink
