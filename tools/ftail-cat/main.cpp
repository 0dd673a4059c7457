// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ftail-cat/main.cpp
 * @brief Copy a growing file to stdout, byte for byte, until end of stream
 *
 * Usage examples:
 *   - Follow a capture forever:                     ftail-cat /var/capture/stream.bin
 *   - Wait up to 30s for the file, stop when idle
 *     for 60s or when the file is deleted:          ftail-cat --wait-first --wait-timeout 30000 \
 *                                                             --idle-timeout 60000 --close-on-delete stream.bin
 *   - Fail right away if the file does not exist:   ftail-cat --no-wait stream.bin
 *
 * SIGINT and SIGTERM cancel the blocking read and end the copy.
 */

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <picojson/picojson.h>
#include <ftail/ftail.h>
#include <ftail/reader.h>

namespace
{
    std::atomic<::ftailReader> g_reader{nullptr};

    void signal_handler(int)
    {
        if (auto const reader = g_reader.load(); reader != nullptr)
        {
            ::ftailReaderCancel(reader);
        }
    }

    /**
     * @brief RAII wrapper around an ftail reader handle
     *
     * Registers the reader with the signal handler for its whole lifetime.
     */
    class ScopedReader
    {
    public:
        /**
         * @param path File to tail
         * @param options JSON reader options
         * @throws std::runtime_error if the reader cannot be created
         */
        ScopedReader(std::string const& path, std::string const& options)
            : _reader{nullptr}
        {
            if (auto const status = ::ftailCreateReader(path.c_str(), options.c_str(), &_reader); status != FTAIL_STATUS_OK)
            {
                throw std::runtime_error{fmt::format("Failed to tail '{}': {}", path, ::ftailStatusToString(status))};
            }
            g_reader.store(_reader);
        }

        ScopedReader(ScopedReader&&) = delete;
        ScopedReader(ScopedReader const&) = delete;

        ScopedReader& operator=(ScopedReader&&) = delete;
        ScopedReader& operator=(ScopedReader const&) = delete;

        ~ScopedReader()
        {
            g_reader.store(nullptr);
            ::ftailReleaseReader(_reader);
        }

        constexpr operator ::ftailReader() const noexcept
        {
            return _reader;
        }

    private:
        ::ftailReader _reader;
    };

    struct CatOptions
    {
        std::int64_t waitTimeoutMs{0};
        std::int64_t idleTimeoutMs{0};
        bool closeOnDelete{false};
        bool closeOnTruncate{false};
        bool timeoutsAsEOF{false};
        bool noWait{false};
        bool waitFirst{false};
        std::size_t bufferSize{64 * 1024};
    };

    std::string makeReaderOptions(CatOptions const& options)
    {
        auto obj = picojson::object{};
        obj["waitForFile"] = picojson::value{!options.noWait};
        obj["waitForFileTimeoutMs"] = picojson::value{static_cast<double>(options.waitTimeoutMs)};
        obj["closeOnDelete"] = picojson::value{options.closeOnDelete};
        obj["closeOnTruncate"] = picojson::value{options.closeOnTruncate};
        obj["idleTimeoutMs"] = picojson::value{static_cast<double>(options.idleTimeoutMs)};
        obj["timeoutsAsEOF"] = picojson::value{options.timeoutsAsEOF};
        return picojson::value{obj}.serialize();
    }

    /** Write the whole buffer to stdout. */
    bool writeOut(std::uint8_t const* data, std::size_t size) noexcept
    {
        while (size > 0)
        {
            auto const n = ::write(STDOUT_FILENO, data, size);
            if (n == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return false;
            }
            data += n;
            size -= static_cast<std::size_t>(n);
        }
        return true;
    }

    /// End of stream and an interrupt by SIGINT/SIGTERM both end the copy successfully.
    constexpr bool isCleanExit(ftailStatus status) noexcept
    {
        return (status == FTAIL_END_OF_STREAM) || (status == FTAIL_ERR_CANCELLED);
    }

    int tailFile(std::string const& path, CatOptions const& options)
    {
        auto const reader = ScopedReader{path, makeReaderOptions(options)};

        if (options.waitFirst)
        {
            if (auto const status = ::ftailReaderWaitForFile(reader, nullptr); isCleanExit(status))
            {
                return EXIT_SUCCESS;
            }
            else if (status != FTAIL_STATUS_OK)
            {
                fmt::print(stderr, "ERROR: Waiting for '{}' failed: {}\n", path, ::ftailStatusToString(status));
                return EXIT_FAILURE;
            }
        }

        auto buffer = std::vector<std::uint8_t>(options.bufferSize);
        for (;;)
        {
            auto bytesRead = std::size_t{0};
            auto const status = ::ftailReaderRead(reader, buffer.data(), buffer.size(), &bytesRead);
            switch (status)
            {
                case FTAIL_STATUS_OK:
                    if (!writeOut(buffer.data(), bytesRead))
                    {
                        fmt::print(stderr, "ERROR: Writing to stdout failed: {}\n", std::strerror(errno));
                        return EXIT_FAILURE;
                    }
                    break;

                default:
                    if (isCleanExit(status))
                    {
                        return EXIT_SUCCESS;
                    }
                    fmt::print(stderr, "ERROR: Reading '{}' failed: {}\n", path, ::ftailStatusToString(status));
                    return EXIT_FAILURE;
            }
        }
    }
}

int main(int argc, char** argv)
{
    auto app = CLI::App{"ftail-cat"};

    auto version = ::ftailVersionType{};
    ::ftailGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto options = CatOptions{};
    app.add_option("--wait-timeout", options.waitTimeoutMs, "Maximum time to wait for the file to exist, in ms (0 = forever)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--idle-timeout", options.idleTimeoutMs, "Maximum time to wait for new data, in ms (0 = forever)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--close-on-delete", options.closeOnDelete, "Stop when the file is deleted or renamed");
    app.add_flag("--close-on-truncate", options.closeOnTruncate, "Stop when the file is truncated");
    app.add_flag("--timeouts-as-eof", options.timeoutsAsEOF, "Stop successfully instead of failing on a timeout");
    app.add_flag("--no-wait", options.noWait, "Fail if the file does not exist instead of waiting for it");
    app.add_flag("--wait-first", options.waitFirst, "Wait for the file to exist before reading, even with --no-wait");
    app.add_option("--buffer-size", options.bufferSize, "Size of the read buffer in bytes")->check(CLI::PositiveNumber);

    auto path = std::string{};
    app.add_option("PATH", path, "File to tail")->required();

    CLI11_PARSE(app, argc, argv);

    std::signal(SIGINT, &signal_handler);
    std::signal(SIGTERM, &signal_handler);

    try
    {
        return tailFile(path, options);
    }
    catch (std::exception const& e)
    {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
