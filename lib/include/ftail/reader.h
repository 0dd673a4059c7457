// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file reader.h
 * @brief Tailing reader API -- blocking, sequential reads of a growing file.
 *
 * A reader follows a single file that another process appends to, much
 * like `tail -f`, but without any notion of lines: every call to
 * ftailReaderRead() returns the next bytes of the file exactly as they were
 * written.  The reader watches the parent directory of the file for change
 * notifications and turns them into blocking reads:
 *
 *   - new data            -> ftailReaderRead() returns it
 *   - no data yet         -> ftailReaderRead() blocks (bounded by the idle timeout)
 *   - file truncated      -> end of stream, or transparent reopen at offset 0
 *   - file deleted/rotated-> end of stream, or wait for the file to come back
 *   - file does not exist -> wait for it (bounded), or fail immediately
 *
 * Typical usage:
 * @code
 *     ftailReader reader;
 *     if (ftailCreateReader("/var/log/capture.bin", "{\"idleTimeoutMs\": 60000}", &reader) != FTAIL_STATUS_OK) { ... }
 *
 *     uint8_t buffer[4096];
 *     for (;;)
 *     {
 *         size_t n = 0;
 *         ftailStatus status = ftailReaderRead(reader, buffer, sizeof buffer, &n);
 *         if (status == FTAIL_END_OF_STREAM) break;
 *         if (status != FTAIL_STATUS_OK) { ... }
 *         consume(buffer, n);
 *     }
 *
 *     ftailReleaseReader(reader);
 * @endcode
 *
 * Options are passed as a JSON object.  Every field is optional; fields that
 * are not present keep their default value:
 *
 * | field                | type   | default | meaning                                             |
 * |----------------------|--------|---------|-----------------------------------------------------|
 * | waitForFile          | bool   | true    | block until the file exists instead of failing      |
 * | waitForFileTimeoutMs | number | 0       | upper bound for the existence wait, 0 = forever      |
 * | closeOnDelete        | bool   | false   | deletion or rename of the file ends the stream      |
 * | closeOnTruncate      | bool   | false   | truncation of the file ends the stream              |
 * | idleTimeoutMs        | number | 0       | max wait for new data, 0 = forever                  |
 * | timeoutsAsEOF        | bool   | false   | report timeouts as end of stream instead of errors  |
 *
 * A reader must only be used from one thread at a time, with the exception
 * of ftailReaderCancel() which may be called from any thread.
 */

#pragma once

#ifdef __cplusplus
#   include <cstddef>
#   include <cstdint>
#else
#   include <stdbool.h>
#   include <stddef.h>
#   include <stdint.h>
#endif

#include <ftail/ftail.h>
#include <ftail/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /** Opaque handle to a tailing reader.  Created by ftailCreateReader(). */
    typedef struct ftailReader_t* ftailReader;

    /**
     * The effective configuration of a reader, as returned by
     * ftailReaderGetOptions().  Timeouts are expressed in nanoseconds;
     * 0 means "wait indefinitely".
     */
    typedef struct ftailReaderOptions
    {
        bool    waitForFile;
        int64_t waitForFileTimeoutNs;
        bool    closeOnDelete;
        bool    closeOnTruncate;
        int64_t idleTimeoutNs;
        bool    treatTimeoutsAsEOF;
    } ftailReaderOptions;

    /**
     * Create a reader tailing \p in_path.
     *
     * The file itself does not need to exist yet, but its parent directory
     * must: the reader establishes a change notification watch on it.
     *
     * @param[in]  in_path     Path to the file to tail (absolute or relative to the working directory).
     * @param[in]  in_options  JSON options object (see above), or NULL / "" for the defaults.
     * @param[out] out_reader  Receives the new reader handle.
     * @return FTAIL_STATUS_OK on success,
     *         FTAIL_ERR_INVALID_ARG if a pointer is NULL or the options are invalid,
     *         FTAIL_ERR_SETUP if the watch could not be established.
     */
    FTAIL_EXPORT
    ftailStatus ftailCreateReader(char const* in_path, char const* in_options, ftailReader* out_reader);

    /**
     * Close the reader and release all its resources (notification watch and
     * open file handle).  The handle is invalid after this call.
     */
    FTAIL_EXPORT
    ftailStatus ftailReleaseReader(ftailReader in_reader);

    /**
     * Read the next bytes of the file into \p out_buffer.
     *
     * Blocks until at least one byte is available, the stream ends, or a
     * timeout expires.  Call repeatedly until FTAIL_END_OF_STREAM.
     *
     * @param[in]  in_reader        The reader.
     * @param[out] out_buffer       Destination buffer.
     * @param[in]  in_capacity      Capacity of \p out_buffer in bytes.  A capacity of 0 returns immediately.
     * @param[out] out_bytesRead    Number of bytes copied into \p out_buffer (0 unless FTAIL_STATUS_OK).
     * @return FTAIL_STATUS_OK, FTAIL_END_OF_STREAM, FTAIL_ERR_IDLE_TIMEOUT, FTAIL_ERR_WAIT_TIMEOUT,
     *         FTAIL_ERR_FILE_ACCESS, FTAIL_ERR_NOTIFICATION, FTAIL_ERR_CANCELLED,
     *         FTAIL_ERR_INVALID_ARG or FTAIL_ERR_INVALID_STATE.
     *
     * FTAIL_ERR_NOTIFICATION is permanent: the reader cannot observe the file
     * any more, and every later call that would block returns it again.
     */
    FTAIL_EXPORT
    ftailStatus ftailReaderRead(ftailReader in_reader, uint8_t* out_buffer, size_t in_capacity, size_t* out_bytesRead);

    /**
     * Block until the file exists, regardless of the waitForFile option,
     * bounded by waitForFileTimeoutMs.
     *
     * @param[in]  in_reader  The reader.
     * @param[out] out_size   Optional (may be NULL).  Receives the current size of the file.
     * @return FTAIL_STATUS_OK, FTAIL_END_OF_STREAM (timeout with timeoutsAsEOF), FTAIL_ERR_WAIT_TIMEOUT,
     *         FTAIL_ERR_FILE_ACCESS, FTAIL_ERR_NOTIFICATION or FTAIL_ERR_CANCELLED.
     */
    FTAIL_EXPORT
    ftailStatus ftailReaderWaitForFile(ftailReader in_reader, int64_t* out_size);

    /**
     * Interrupt a blocking ftailReaderRead() / ftailReaderWaitForFile() in
     * progress on another thread; it returns FTAIL_ERR_CANCELLED.  If no call
     * is blocked, the next wait returns FTAIL_ERR_CANCELLED immediately.
     */
    FTAIL_EXPORT
    ftailStatus ftailReaderCancel(ftailReader in_reader);

    /**
     * Get the number of bytes delivered since the file was last (re)opened.
     */
    FTAIL_EXPORT
    ftailStatus ftailReaderGetOffset(ftailReader in_reader, int64_t* out_offset);

    /**
     * Get the effective options of the reader.
     */
    FTAIL_EXPORT
    ftailStatus ftailReaderGetOptions(ftailReader in_reader, ftailReaderOptions* out_options);

#ifdef __cplusplus
}
#endif
