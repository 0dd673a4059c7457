// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for ftail internal diagnostics
 *
 * Thin wrapper around spdlog for all ftail internal logging:
 * - All macros wrap log calls in try/catch so that logging can never break a read
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the FTAIL_LOG_LEVEL environment variable
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
//
// Actual logging levels can be configured through the FTAIL_LOG_LEVEL environment variable,
// using the spdlog level syntax (e.g. "debug" or "off").
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>
#include <ftail/platform.h>

namespace ftail::lib
{
    /**
     * Apply the FTAIL_LOG_LEVEL environment variable to the spdlog registry.
     * Runs once per process; later calls are no-ops. Called on reader creation.
     */
    FTAIL_EXPORT
    void initLogging() noexcept;
}

// Runs a logging statement, dropping any exception it throws.
#define FTAIL_LOG_NOTHROW(statement) \
    do                               \
    {                                \
        try                          \
        {                            \
            statement;               \
        }                            \
        catch (...)                  \
        {}                           \
    }                                \
    while (false)

#define FTAIL_TRACE(...)    FTAIL_LOG_NOTHROW(SPDLOG_TRACE(__VA_ARGS__))
#define FTAIL_DEBUG(...)    FTAIL_LOG_NOTHROW(SPDLOG_DEBUG(__VA_ARGS__))
#define FTAIL_INFO(...)     FTAIL_LOG_NOTHROW(SPDLOG_INFO(__VA_ARGS__))
#define FTAIL_WARN(...)     FTAIL_LOG_NOTHROW(SPDLOG_WARN(__VA_ARGS__))
#define FTAIL_ERROR(...)    FTAIL_LOG_NOTHROW(SPDLOG_ERROR(__VA_ARGS__))
#define FTAIL_CRITICAL(...) FTAIL_LOG_NOTHROW(SPDLOG_CRITICAL(__VA_ARGS__))
