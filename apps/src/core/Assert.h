#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), WATERCLOCK_ASSERT is never compiled out.
 * Use for contract violations that indicate a bug in the caller, such as
 * projecting a digit outside 0-9.
 *
 * When an assertion fails:
 * - Logs a CRITICAL message with file, line, and condition
 * - Aborts the program immediately
 *
 * Example:
 *   WATERCLOCK_ASSERT(digit >= 0 && digit <= 9, "Digit must be in 0-9");
 */
#define WATERCLOCK_ASSERT(condition, message)                                               \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
