// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TailOptions.hpp
 * @brief Configuration of a TailingReader, built from composable options
 *
 * A TailOptions value is produced by folding a list of TailOption functions,
 * left to right, over a zero-valued TailOptions.  Later options override
 * earlier ones for the same field:
 *
 * @code
 *     auto const options = makeTailOptions({
 *         withWaitForFile(true, fromSeconds(30)), // wait for the file, but only for 30 seconds
 *         withIdleTimeout(fromSeconds(60)),       // give up if nothing is written for 60 seconds
 *         withCloseOnDelete(true),                // deleting the file ends the stream
 *     });
 * @endcode
 *
 * Readers constructed without options use defaultTailOptions(): wait for the
 * file indefinitely and keep following it across deletions.
 *
 * Durations are not validated.  Any non-positive duration means "no timeout".
 */

#pragma once

#include <functional>
#include <initializer_list>
#include <ftail/platform.h>
#include "ftail-internal/Timing.hpp"

namespace ftail::lib
{
    struct TailOptions
    {
        /**
         * Block until the file exists instead of failing with FTAIL_ERR_FILE_ACCESS.
         * Also makes the reader wait for the file to come back after it was
         * deleted, when closeOnDelete is false.
         */
        bool waitForFile{false};

        /** Upper bound on the existence wait.  Zero waits indefinitely. */
        Duration waitForFileTimeout{};

        /** Deleting or renaming the file ends the stream. */
        bool closeOnDelete{false};

        /** Truncating the file below the current offset ends the stream. */
        bool closeOnTruncate{false};

        /** Maximum wait for new data.  Zero waits indefinitely. */
        Duration idleTimeout{};

        /** Report wait and idle timeouts as FTAIL_END_OF_STREAM instead of errors. */
        bool treatTimeoutsAsEOF{false};
    };

    [[nodiscard]]
    constexpr bool operator==(TailOptions const& lhs, TailOptions const& rhs) noexcept
    {
        return (lhs.waitForFile == rhs.waitForFile) && (lhs.waitForFileTimeout == rhs.waitForFileTimeout) &&
               (lhs.closeOnDelete == rhs.closeOnDelete) && (lhs.closeOnTruncate == rhs.closeOnTruncate) &&
               (lhs.idleTimeout == rhs.idleTimeout) && (lhs.treatTimeoutsAsEOF == rhs.treatTimeoutsAsEOF);
    }

    /** A named option: a transformation applied in place to a TailOptions. */
    using TailOption = std::function<void(TailOptions&)>;

    FTAIL_EXPORT
    TailOption withWaitForFile(bool wait, Duration timeout = Duration{});

    FTAIL_EXPORT
    TailOption withCloseOnDelete(bool close);

    FTAIL_EXPORT
    TailOption withCloseOnTruncate(bool close);

    FTAIL_EXPORT
    TailOption withIdleTimeout(Duration timeout);

    FTAIL_EXPORT
    TailOption withTimeoutsAsEOF(bool timeoutsAsEOF);

    /**
     * Fold the options over a zero-valued TailOptions, in order.
     * An empty list yields a zero-valued TailOptions, not the defaults.
     */
    [[nodiscard]]
    FTAIL_EXPORT
    TailOptions makeTailOptions(std::initializer_list<TailOption> options);

    /**
     * Apply the options, in order, on top of an existing configuration.
     */
    FTAIL_EXPORT
    void applyTailOptions(TailOptions& inout_options, std::initializer_list<TailOption> options);

    /**
     * The configuration used when the caller supplies none: wait for the file
     * indefinitely and do not close on delete.
     */
    [[nodiscard]]
    constexpr TailOptions defaultTailOptions() noexcept
    {
        auto options = TailOptions{};
        options.waitForFile = true;
        options.waitForFileTimeout = Duration{};
        options.closeOnDelete = false;
        return options;
    }
}
