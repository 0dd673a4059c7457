// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ReaderOptionsParser.cpp
 * @brief Maps a JSON options object onto TailOptions
 *
 * Timeouts are given in milliseconds in JSON (a human friendly unit for a
 * configuration file) and stored as nanosecond Durations internally.
 */

#include "ftail-internal/ReaderOptionsParser.hpp"
#include <picojson/picojson.h>
#include "ftail-internal/Exception.hpp"
#include "ftail-internal/Logging.hpp"

namespace ftail::lib
{
    namespace
    {
        void readBool(picojson::object const& root, char const* field, bool& out_value)
        {
            if (auto const it = root.find(field); it != root.end())
            {
                if (!it->second.is<bool>())
                {
                    throw Exception::invalidArgument("{} must be a boolean.", field);
                }
                out_value = it->second.get<bool>();
            }
        }

        void readTimeoutMs(picojson::object const& root, char const* field, Duration& out_value)
        {
            if (auto const it = root.find(field); it != root.end())
            {
                if (!it->second.is<double>())
                {
                    throw Exception::invalidArgument("{} must be a number.", field);
                }

                auto const v = it->second.get<double>();
                if (v < 0)
                {
                    throw Exception::invalidArgument("{} must be greater or equal to 0.", field);
                }
                // Saturates: a value beyond the nanosecond range waits indefinitely.
                out_value = fromMilliSeconds(v);
            }
        }
    }

    ReaderOptionsParser::ReaderOptionsParser()
        : _options{defaultTailOptions()}
    {}

    ReaderOptionsParser::ReaderOptionsParser(std::string const& in_options)
        : _options{defaultTailOptions()}
    {
        if (in_options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw Exception::invalidArgument("Invalid JSON options. {}", err);
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::invalidArgument("Expected a JSON object");
        }
        auto const& root = jsonValue.get<picojson::object>();

        readBool(root, "waitForFile", _options.waitForFile);
        readTimeoutMs(root, "waitForFileTimeoutMs", _options.waitForFileTimeout);
        readBool(root, "closeOnDelete", _options.closeOnDelete);
        readBool(root, "closeOnTruncate", _options.closeOnTruncate);
        readTimeoutMs(root, "idleTimeoutMs", _options.idleTimeout);
        readBool(root, "timeoutsAsEOF", _options.treatTimeoutsAsEOF);

        FTAIL_DEBUG("Reader options: waitForFile={} waitForFileTimeout={}ms closeOnDelete={} closeOnTruncate={} idleTimeout={}ms timeoutsAsEOF={}",
            _options.waitForFile,
            inMilliSeconds(_options.waitForFileTimeout),
            _options.closeOnDelete,
            _options.closeOnTruncate,
            inMilliSeconds(_options.idleTimeout),
            _options.treatTimeoutsAsEOF);
    }

    TailOptions const& ReaderOptionsParser::getOptions() const noexcept
    {
        return _options;
    }
}
