// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ReaderOptionsParser.hpp
 * @brief Parse the JSON options passed to ftailCreateReader()
 *
 * The C API cannot pass TailOption functions around, so its callers describe
 * the configuration as a JSON object instead:
 *
 * {
 *   "waitForFile": true,           // block until the file exists
 *   "waitForFileTimeoutMs": 30000, // ... but only for 30 seconds
 *   "closeOnDelete": true,         // deleting the file ends the stream
 *   "closeOnTruncate": false,      // truncation reopens the file at offset 0
 *   "idleTimeoutMs": 60000,        // give up after 60 seconds without new data
 *   "timeoutsAsEOF": false         // timeouts are errors, not end of stream
 * }
 *
 * Design:
 * - Every field is optional and overrides the corresponding field of
 *   defaultTailOptions(); an empty string selects the defaults as-is
 * - Unknown fields are ignored
 * - Validated during parsing (throws Exception with FTAIL_ERR_INVALID_ARG)
 */

#pragma once

#include <string>
#include <ftail/platform.h>
#include "ftail-internal/TailOptions.hpp"

namespace ftail::lib
{
    class FTAIL_EXPORT ReaderOptionsParser
    {
    public:
        /** Default constructor: no options (defaultTailOptions()). */
        ReaderOptionsParser();

        /**
         * Parse a JSON string of reader options.
         *
         * @param in_options JSON object, or an empty string for the defaults
         * @throws Exception (FTAIL_ERR_INVALID_ARG) if the JSON is malformed, the root is not
         *         an object, a field has the wrong type or a timeout is negative
         */
        explicit ReaderOptionsParser(std::string const& in_options);

        /** The resulting reader configuration. */
        [[nodiscard]]
        TailOptions const& getOptions() const noexcept;

    private:
        TailOptions _options;
    };
}
