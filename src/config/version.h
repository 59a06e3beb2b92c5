// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file version.h
 * @brief DmxLink version constants
 *
 * DMX_VERSION_NUMBER encodes MAJOR*10000 + MINOR*100 + PATCH as a single
 * uint32_t for simple numeric comparison (e.g., 1.2.3 -> 10203).
 */

#pragma once

#include <stdint.h>

// ============================================================================
// Version Components
// ============================================================================

#define DMX_VERSION_MAJOR  1
#define DMX_VERSION_MINOR  0
#define DMX_VERSION_PATCH  0

// ============================================================================
// Derived Version Identifiers
// ============================================================================

/**
 * @brief Human-readable version string
 *
 * Overridable via build flag: -D DMX_VERSION_STRING=\"1.0.1-beta\"
 */
#ifndef DMX_VERSION_STRING
#define DMX_VERSION_STRING "1.0.0"
#endif

#define DMX_VERSION_NUMBER \
    ((uint32_t)(DMX_VERSION_MAJOR * 10000 + DMX_VERSION_MINOR * 100 + DMX_VERSION_PATCH))
