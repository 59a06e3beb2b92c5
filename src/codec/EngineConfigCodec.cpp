// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EngineConfigCodec.cpp
 * @brief Engine configuration codec implementation
 *
 * Single canonical JSON parser for the configuration file.
 * Enforces strict validation and prevents JSON key access outside this module.
 */

#include "EngineConfigCodec.h"

#include <cmath>
#include <cstdio>
#include <fstream>

namespace dmxlink {
namespace codec {

namespace {

// ============================================================================
// Field Helpers
// ============================================================================

const char* const ROOT_KEYS[] = { "port", "frameRateHz", "connection", "log" };
const char* const PORT_KEYS[] = {
    "path", "baudRate", "dataBits", "stopBits", "parity",
    "breakMode", "breakUs", "mabUs", "breakBaudRate", "writeTimeoutMs"
};
const char* const CONNECTION_KEYS[] = {
    "maxRetries", "connectTimeoutMs", "retryDelayMs",
    "backoffMultiplier", "maxRetryDelayMs", "reconnectOnSendFailure"
};
const char* const LOG_KEYS[] = { "level", "color" };

template <size_t N>
bool rejectUnknownKeys(JsonObjectConst obj, const char* section, const char* const (&allowed)[N], char* errorMsg) {
    for (JsonPairConst kv : obj) {
        const char* key = kv.key().c_str();
        bool known = false;
        for (size_t i = 0; i < N; ++i) {
            if (strcmp(key, allowed[i]) == 0) {
                known = true;
                break;
            }
        }
        if (!known) {
            if (section[0] != '\0') {
                snprintf(errorMsg, MAX_ERROR_MSG, "Unknown field '%s.%s'", section, key);
            } else {
                snprintf(errorMsg, MAX_ERROR_MSG, "Unknown field '%s'", key);
            }
            return false;
        }
    }
    return true;
}

void fieldName(const char* section, const char* key, char* out, size_t outSize) {
    if (section[0] != '\0') {
        snprintf(out, outSize, "%s.%s", section, key);
    } else {
        snprintf(out, outSize, "%s", key);
    }
}

/**
 * Absent keys keep the default already in @p out.
 */
bool decodeUint(JsonObjectConst obj, const char* section, const char* key,
                uint32_t minValue, uint32_t maxValue, uint32_t& out, char* errorMsg) {
    if (!obj.containsKey(key)) {
        return true;
    }
    char name[48];
    fieldName(section, key, name, sizeof(name));

    if (!obj[key].is<uint32_t>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be a non-negative integer", name);
        return false;
    }
    uint32_t value = obj[key].as<uint32_t>();
    if (value < minValue || value > maxValue) {
        snprintf(errorMsg, MAX_ERROR_MSG, "%s out of range (%lu-%lu): %lu", name,
                 (unsigned long)minValue, (unsigned long)maxValue, (unsigned long)value);
        return false;
    }
    out = value;
    return true;
}

bool decodeUint8(JsonObjectConst obj, const char* section, const char* key,
                 uint8_t minValue, uint8_t maxValue, uint8_t& out, char* errorMsg) {
    uint32_t wide = out;
    if (!decodeUint(obj, section, key, minValue, maxValue, wide, errorMsg)) {
        return false;
    }
    out = static_cast<uint8_t>(wide);
    return true;
}

bool decodeBool(JsonObjectConst obj, const char* section, const char* key, bool& out, char* errorMsg) {
    if (!obj.containsKey(key)) {
        return true;
    }
    if (!obj[key].is<bool>()) {
        char name[48];
        fieldName(section, key, name, sizeof(name));
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be a boolean", name);
        return false;
    }
    out = obj[key].as<bool>();
    return true;
}

bool decodeSection(JsonObjectConst root, const char* key, JsonObjectConst& out, char* errorMsg) {
    if (!root.containsKey(key)) {
        return true;
    }
    if (!root[key].is<JsonObjectConst>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be an object", key);
        return false;
    }
    out = root[key].as<JsonObjectConst>();
    return true;
}

const char* logLevelKey(utils::LogLevel level) {
    switch (level) {
        case utils::LogLevel::None:  return "none";
        case utils::LogLevel::Error: return "error";
        case utils::LogLevel::Warn:  return "warn";
        case utils::LogLevel::Debug: return "debug";
        case utils::LogLevel::Info:
        default:                     return "info";
    }
}

// ============================================================================
// Sections
// ============================================================================

bool decodePort(JsonObjectConst port, hal::SerialOptions& serial, char* errorMsg) {
    if (!rejectUnknownKeys(port, "port", PORT_KEYS, errorMsg)) {
        return false;
    }

    // Extract path (required, non-empty string)
    if (!port.containsKey("path")) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Missing required field 'port.path'");
        return false;
    }
    if (!port["path"].is<const char*>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field 'port.path' must be a string");
        return false;
    }
    const char* path = port["path"].as<const char*>();
    if (path[0] == '\0') {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field 'port.path' must not be empty");
        return false;
    }
    serial.portPath = path;

    if (!decodeUint(port, "port", "baudRate", 1200, 4000000, serial.baudRate, errorMsg) ||
        !decodeUint8(port, "port", "dataBits", 5, 8, serial.dataBits, errorMsg) ||
        !decodeUint8(port, "port", "stopBits", 1, 2, serial.stopBits, errorMsg) ||
        !decodeUint(port, "port", "breakUs", 88, 1000000, serial.breakUs, errorMsg) ||
        !decodeUint(port, "port", "mabUs", 8, 1000000, serial.mabUs, errorMsg) ||
        !decodeUint(port, "port", "breakBaudRate", 300, 250000, serial.breakBaudRate, errorMsg) ||
        !decodeUint(port, "port", "writeTimeoutMs", 1, 60000, serial.writeTimeoutMs, errorMsg)) {
        return false;
    }

    if (port.containsKey("parity")) {
        if (!port["parity"].is<const char*>()) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Field 'port.parity' must be a string");
            return false;
        }
        const char* parity = port["parity"].as<const char*>();
        if (!hal::parseParity(parity, serial.parity)) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Invalid parity '%s' (must be none, even, or odd)", parity);
            return false;
        }
    }

    if (port.containsKey("breakMode")) {
        if (!port["breakMode"].is<const char*>()) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Field 'port.breakMode' must be a string");
            return false;
        }
        const char* mode = port["breakMode"].as<const char*>();
        if (!hal::parseBreakMode(mode, serial.breakMode)) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Invalid breakMode '%s' (must be ioctl or baud-toggle)", mode);
            return false;
        }
    }
    return true;
}

bool decodeConnection(JsonObjectConst conn, connection::RetryPolicy& retry, char* errorMsg) {
    if (!rejectUnknownKeys(conn, "connection", CONNECTION_KEYS, errorMsg)) {
        return false;
    }

    if (!decodeUint(conn, "connection", "maxRetries", 1, 100, retry.maxRetries, errorMsg) ||
        !decodeUint(conn, "connection", "connectTimeoutMs", 1, 600000, retry.connectTimeoutMs, errorMsg) ||
        !decodeUint(conn, "connection", "retryDelayMs", 0, 600000, retry.retryDelayMs, errorMsg) ||
        !decodeUint(conn, "connection", "maxRetryDelayMs", 0, 600000, retry.maxRetryDelayMs, errorMsg) ||
        !decodeBool(conn, "connection", "reconnectOnSendFailure", retry.reconnectOnSendFailure, errorMsg)) {
        return false;
    }

    // Extract backoffMultiplier (optional, 1.0-10.0)
    if (conn.containsKey("backoffMultiplier")) {
        if (!conn["backoffMultiplier"].is<double>()) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Field 'connection.backoffMultiplier' must be a number");
            return false;
        }
        double multiplier = conn["backoffMultiplier"].as<double>();
        if (!std::isfinite(multiplier) || multiplier < 1.0 || multiplier > 10.0) {
            snprintf(errorMsg, MAX_ERROR_MSG, "connection.backoffMultiplier out of range (1.0-10.0): %.2f", multiplier);
            return false;
        }
        retry.backoffMultiplier = multiplier;
    }
    return true;
}

bool decodeLog(JsonObjectConst log, EngineConfig& config, char* errorMsg) {
    if (!rejectUnknownKeys(log, "log", LOG_KEYS, errorMsg)) {
        return false;
    }

    if (log.containsKey("level")) {
        if (!log["level"].is<const char*>()) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Field 'log.level' must be a string");
            return false;
        }
        const char* level = log["level"].as<const char*>();
        if (!utils::parseLogLevel(level, config.logLevel)) {
            snprintf(errorMsg, MAX_ERROR_MSG, "Invalid log level '%s' (must be none, error, warn, info, or debug)", level);
            return false;
        }
    }
    return decodeBool(log, "log", "color", config.logColor, errorMsg);
}

} // namespace

// ============================================================================
// Decode
// ============================================================================

EngineConfigDecodeResult EngineConfigCodec::decode(JsonObjectConst root) {
    EngineConfigDecodeResult result;
    result.config = EngineConfig();

    if (root.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Configuration root must be an object");
        return result;
    }
    if (!rejectUnknownKeys(root, "", ROOT_KEYS, result.errorMsg)) {
        return result;
    }

    // port (required)
    if (!root.containsKey("port")) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing required field 'port'");
        return result;
    }
    JsonObjectConst port;
    if (!decodeSection(root, "port", port, result.errorMsg) ||
        !decodePort(port, result.config.connect.serial, result.errorMsg)) {
        return result;
    }

    if (!decodeUint(root, "", "frameRateHz", scheduler::MIN_FRAME_RATE_HZ, scheduler::MAX_FRAME_RATE_HZ,
                    result.config.connect.frameRateHz, result.errorMsg)) {
        return result;
    }

    if (root.containsKey("connection")) {
        JsonObjectConst conn;
        if (!decodeSection(root, "connection", conn, result.errorMsg) ||
            !decodeConnection(conn, result.config.connect.retry, result.errorMsg)) {
            return result;
        }
    }

    if (root.containsKey("log")) {
        JsonObjectConst log;
        if (!decodeSection(root, "log", log, result.errorMsg) ||
            !decodeLog(log, result.config, result.errorMsg)) {
            return result;
        }
    }

    // Single-attempt timeout follows the connection policy
    result.config.connect.serial.openTimeoutMs = result.config.connect.retry.connectTimeoutMs;

    result.success = true;
    return result;
}

EngineConfigDecodeResult EngineConfigCodec::decodeString(const std::string& json) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        EngineConfigDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", error.c_str());
        return result;
    }
    if (!doc.is<JsonObjectConst>()) {
        EngineConfigDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Configuration root must be an object");
        return result;
    }
    return decode(doc.as<JsonObjectConst>());
}

EngineConfigDecodeResult EngineConfigCodec::loadFile(const char* path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        EngineConfigDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Cannot open config file '%s'", path);
        return result;
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, in);
    if (error) {
        EngineConfigDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON in '%s': %s", path, error.c_str());
        return result;
    }
    if (!doc.is<JsonObjectConst>()) {
        EngineConfigDecodeResult result;
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Configuration root must be an object");
        return result;
    }
    return decode(doc.as<JsonObjectConst>());
}

// ============================================================================
// Encode
// ============================================================================

void EngineConfigCodec::encode(const EngineConfig& config, JsonObject root) {
    const hal::SerialOptions& serial = config.connect.serial;
    const connection::RetryPolicy& retry = config.connect.retry;

    JsonObject port = root["port"].to<JsonObject>();
    port["path"] = serial.portPath;
    port["baudRate"] = serial.baudRate;
    port["dataBits"] = serial.dataBits;
    port["stopBits"] = serial.stopBits;
    port["parity"] = hal::parityName(serial.parity);
    port["breakMode"] = hal::breakModeName(serial.breakMode);
    port["breakUs"] = serial.breakUs;
    port["mabUs"] = serial.mabUs;
    port["breakBaudRate"] = serial.breakBaudRate;
    port["writeTimeoutMs"] = serial.writeTimeoutMs;

    root["frameRateHz"] = config.connect.frameRateHz;

    JsonObject conn = root["connection"].to<JsonObject>();
    conn["maxRetries"] = retry.maxRetries;
    conn["connectTimeoutMs"] = retry.connectTimeoutMs;
    conn["retryDelayMs"] = retry.retryDelayMs;
    conn["backoffMultiplier"] = retry.backoffMultiplier;
    conn["maxRetryDelayMs"] = retry.maxRetryDelayMs;
    conn["reconnectOnSendFailure"] = retry.reconnectOnSendFailure;

    JsonObject log = root["log"].to<JsonObject>();
    log["level"] = logLevelKey(config.logLevel);
    log["color"] = config.logColor;
}

std::string EngineConfigCodec::encodeString(const EngineConfig& config, bool pretty) {
    JsonDocument doc;
    encode(config, doc.to<JsonObject>());

    std::string out;
    if (pretty) {
        serializeJsonPretty(doc, out);
    } else {
        serializeJson(doc, out);
    }
    return out;
}

} // namespace codec
} // namespace dmxlink
