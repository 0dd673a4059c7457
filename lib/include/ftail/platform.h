// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Compiler portability macros shared by every public ftail header.
 *
 * Macros defined here:
 *   - FTAIL_EXPORT      : Marks a symbol for export from the shared library.
 *   - FTAIL_NODISCARD   : Warns callers if they discard the return value.
 *   - FTAIL_CONSTEXPR   : Maps to `constexpr` in C++ and `inline` in C.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * FTAIL_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * The library is built with -fvisibility=hidden, so everything that forms
 * part of the public (or test-visible internal) surface carries this macro.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define FTAIL_EXPORT __attribute__((visibility("default")))
#else
#   define FTAIL_EXPORT
#endif

/*
 * ---------------------------------------------------------------------------
 * FTAIL_NODISCARD / FTAIL_CONSTEXPR  --  Language-level portability
 * ---------------------------------------------------------------------------
 */
#ifdef __cplusplus
#   define FTAIL_NODISCARD [[nodiscard]]
#   define FTAIL_CONSTEXPR constexpr
#else
#   define FTAIL_NODISCARD
#   define FTAIL_CONSTEXPR inline
#endif
