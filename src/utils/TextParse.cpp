// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#include "TextParse.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace dmxlink {
namespace utils {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); i++) {
        s[i] = static_cast<char>(tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

bool parseInteger(const char* text, long long minValue, long long maxValue, long long& out) {
    if (text == nullptr || *text == '\0') return false;

    char* end = nullptr;
    errno = 0;
    long long value = strtoll(text, &end, 10);
    if (end == text || *end != '\0') return false;
    if (errno == ERANGE) return false;
    if (value < minValue || value > maxValue) return false;

    out = value;
    return true;
}

bool parseNumber(const char* text, double& out) {
    if (text == nullptr || *text == '\0') return false;

    char* end = nullptr;
    double value = strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = value;
    return true;
}

} // namespace utils
} // namespace dmxlink
