// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TextParse.h
 * @brief Strict parsing of operator-typed tokens (dmxctl command line)
 *
 * Every parser rejects trailing garbage and empty input. Integer parsers
 * take explicit bounds so a value is never narrowed on its way to an
 * engine call.
 */

#pragma once

#include <string>

namespace dmxlink {
namespace utils {

std::string trim(const std::string& s);
std::string toLower(std::string s);
bool startsWith(const std::string& s, const char* prefix);

/**
 * @brief Parse a base-10 integer within [minValue, maxValue]
 * @return false on syntax error, overflow or a value outside the bounds
 */
bool parseInteger(const char* text, long long minValue, long long maxValue, long long& out);

/**
 * @brief Parse a finite or non-finite decimal number (strtod syntax)
 */
bool parseNumber(const char* text, double& out);

} // namespace utils
} // namespace dmxlink
