// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EngineConfigCodec.h
 * @brief JSON codec for the engine configuration file
 *
 * Single canonical location for parsing configuration JSON into typed C++ structs.
 * Enforces type checking, range validation, and unknown-key rejection.
 *
 * Rule: Only this module is allowed to read JSON keys from configuration.
 * All other code consumes EngineConfig.
 *
 * Schema (everything but port.path optional):
 *   {
 *     "port": { "path", "baudRate", "dataBits", "stopBits", "parity",
 *               "breakMode", "breakUs", "mabUs", "breakBaudRate", "writeTimeoutMs" },
 *     "frameRateHz": 30,
 *     "connection": { "maxRetries", "connectTimeoutMs", "retryDelayMs",
 *                     "backoffMultiplier", "maxRetryDelayMs", "reconnectOnSendFailure" },
 *     "log": { "level", "color" }
 *   }
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstring>
#include <string>

#include "../core/Result.h"
#include "../core/connection/ConnectionManager.h"
#include "../utils/Log.h"

namespace dmxlink {
namespace codec {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

/**
 * @brief Fully decoded configuration with defaults applied
 */
struct EngineConfig {
    connection::ConnectOptions connect;
    utils::LogLevel logLevel;
    bool logColor;

    EngineConfig() : logLevel(utils::DEFAULT_LOG_LEVEL), logColor(true) {}
};

struct EngineConfigDecodeResult {
    bool success;
    EngineConfig config;
    char errorMsg[MAX_ERROR_MSG];

    EngineConfigDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }

    /**
     * @brief CONFIGURATION error carrying errorMsg, or success
     */
    Result toResult() const {
        return success ? Result::success() : Result::error(ErrorCode::CONFIGURATION, errorMsg);
    }
};

/**
 * @brief Engine configuration JSON codec
 */
class EngineConfigCodec {
public:
    /**
     * @brief Decode a parsed configuration document
     *
     * @param root JSON root object (const, prevents mutation)
     * @return EngineConfigDecodeResult with config or error
     */
    static EngineConfigDecodeResult decode(JsonObjectConst root);

    /**
     * @brief Parse and decode configuration text
     */
    static EngineConfigDecodeResult decodeString(const std::string& json);

    /**
     * @brief Read, parse and decode a configuration file
     */
    static EngineConfigDecodeResult loadFile(const char* path);

    /**
     * @brief Write every field (including defaults) into @p root
     */
    static void encode(const EngineConfig& config, JsonObject root);

    /**
     * @brief Serialize a configuration to JSON text
     */
    static std::string encodeString(const EngineConfig& config, bool pretty = true);
};

} // namespace codec
} // namespace dmxlink
