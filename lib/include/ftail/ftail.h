// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ftail.h
 * @brief Core ftail SDK entry point -- status codes and versioning.
 *
 * This header defines:
 *
 *   1. **ftailStatus**      -- The error/success codes returned by every ftail function.
 *   2. **ftailVersionType** -- Semantic version of the SDK at runtime.
 *
 * The reader API itself lives in <ftail/reader.h>.
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <ftail/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /* ======================================================================
     * Status codes
     * ======================================================================
     * FTAIL_END_OF_STREAM is not an error: it is the terminal signal telling
     * the caller that no further bytes will ever be produced by the reader.
     * Timeouts, file access failures and cancellation are recoverable; the
     * reader stays consistent and the call may simply be retried.
     * ==================================================================== */

    typedef enum ftailStatus
    {
        FTAIL_STATUS_OK,          /**< Success -- the operation completed normally.                              */
        FTAIL_END_OF_STREAM,      /**< No more data will be produced. Terminal for the reader.                   */
        FTAIL_ERR_UNKNOWN,        /**< An unexpected internal error occurred.                                    */
        FTAIL_ERR_INVALID_ARG,    /**< One or more arguments are NULL or otherwise invalid.                      */
        FTAIL_ERR_INVALID_STATE,  /**< The reader has already been closed.                                       */
        FTAIL_ERR_SETUP,          /**< The change notification watch could not be established.                  */
        FTAIL_ERR_WAIT_TIMEOUT,   /**< The file did not appear within the configured wait-for-file timeout.      */
        FTAIL_ERR_IDLE_TIMEOUT,   /**< No new data arrived within the configured idle timeout.                   */
        FTAIL_ERR_FILE_ACCESS,    /**< The file is missing (and waiting is disabled) or could not be opened/read. */
        FTAIL_ERR_NOTIFICATION,   /**< The change notification connection reported a transport error.            */
        FTAIL_ERR_CANCELLED,      /**< A blocking wait was interrupted by ftailReaderCancel().                    */
    } ftailStatus;

    /**
     * Return a static, human-readable name for a status code
     * (e.g. "FTAIL_ERR_IDLE_TIMEOUT"). Never returns NULL.
     */
    FTAIL_EXPORT
    char const* ftailStatusToString(ftailStatus status);

    /* ======================================================================
     * SDK version
     * ==================================================================== */

    typedef struct ftailVersionType
    {
        uint16_t    major;  /**< Major version -- incremented on breaking API changes. */
        uint16_t    minor;  /**< Minor version -- incremented on backwards-compatible additions. */
        uint16_t    bugfix; /**< Patch version -- incremented on backwards-compatible bug fixes. */
        char const* full;   /**< Human-readable version string, e.g. "1.0.0". Owned by the library. */
    } ftailVersionType;

    /**
     * Retrieve the version of the ftail SDK that is currently linked.
     *
     * @param[out] out_version  Filled with the version information. Must not be NULL.
     * @return FTAIL_STATUS_OK on success,
     *         FTAIL_ERR_INVALID_ARG if \p out_version is NULL.
     */
    FTAIL_EXPORT
    ftailStatus ftailGetVersion(ftailVersionType* out_version);

#ifdef __cplusplus
}
#endif
