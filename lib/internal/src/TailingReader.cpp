// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/TailingReader.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fmt/format.h>
#include <fmt/std.h>
#include "ftail-internal/Exception.hpp"
#include "ftail-internal/InotifyChangeNotifier.hpp"
#include "ftail-internal/Logging.hpp"
#include "ftail-internal/PathUtils.hpp"

namespace ftail::lib
{
    namespace
    {
        // Truncation shows up as an attribute change on some filesystems.
        constexpr auto const DATA_CHANGES = ChangeKind::Create | ChangeKind::Write | ChangeKind::Remove | ChangeKind::Rename |
                                            ChangeKind::AttributeChange;

        bool namesFile(std::filesystem::path const& path)
        {
            if (!path.has_filename())
            {
                return false;
            }
            auto const name = path.filename();
            return (name != ".") && (name != "..");
        }
    }

    TailingReader::TailingReader(std::filesystem::path const& path, TailOptions const& options)
        : TailingReader{path, options, std::make_unique<InotifyChangeNotifier>()}
    {}

    TailingReader::TailingReader(std::filesystem::path const& path, TailOptions const& options, std::unique_ptr<ChangeNotifier> notifier)
        : _path{makeTargetPath(path)}
        , _options{options}
        , _notifier{std::move(notifier)}
        , _file{}
        , _offset{0}
        , _endOfStream{false}
        , _closed{false}
    {
        initLogging();

        if (!namesFile(_path))
        {
            throw Exception::invalidArgument("Path '{}' does not name a file", path);
        }
        if (!_notifier)
        {
            throw Exception::invalidArgument("No change notifier for '{}'", _path);
        }

        _notifier->watch(makeWatchDirectory(_path));

        FTAIL_DEBUG("Tailing {} (waitForFile={}, waitForFileTimeout={}ms, closeOnDelete={}, closeOnTruncate={}, idleTimeout={}ms, "
                    "timeoutsAsEOF={})",
            _path,
            _options.waitForFile,
            inMilliSeconds(_options.waitForFileTimeout),
            _options.closeOnDelete,
            _options.closeOnTruncate,
            inMilliSeconds(_options.idleTimeout),
            _options.treatTimeoutsAsEOF);
    }

    TailingReader::~TailingReader()
    {
        close();
    }

    ftailStatus TailingReader::waitForFile(std::int64_t* out_size)
    {
        if (_closed)
        {
            return FTAIL_ERR_INVALID_STATE;
        }
        if (_endOfStream)
        {
            return FTAIL_END_OF_STREAM;
        }

        auto size = std::int64_t{0};
        auto const status = resolveFileSize(true, size);
        if ((status == FTAIL_STATUS_OK) && (out_size != nullptr))
        {
            *out_size = size;
        }
        return status;
    }

    ftailStatus TailingReader::read(std::uint8_t* buffer, std::size_t capacity, std::size_t& out_bytesRead)
    {
        out_bytesRead = 0;

        if (_closed)
        {
            return FTAIL_ERR_INVALID_STATE;
        }
        if (_endOfStream)
        {
            return FTAIL_END_OF_STREAM;
        }
        if (capacity == 0)
        {
            return FTAIL_STATUS_OK;
        }
        if (buffer == nullptr)
        {
            return FTAIL_ERR_INVALID_ARG;
        }

        for (;;)
        {
            auto size = std::int64_t{0};
            if (auto const status = resolveFileSize(false, size); status != FTAIL_STATUS_OK)
            {
                return status;
            }

            if (_offset > size)
            {
                FTAIL_INFO("{} was truncated to {} bytes at offset {}", _path, size, _offset);
                closeFile();
                if (_options.closeOnTruncate)
                {
                    return endOfStream();
                }
            }

            if (_offset < size)
            {
                if (!_file)
                {
                    if (auto const error = _file.open(_path); error != 0)
                    {
                        if (isFileMissingError(error))
                        {
                            // Deleted between stat() and open(): start over with the existence check.
                            continue;
                        }
                        FTAIL_WARN("Could not open {}: {}", _path, std::strerror(error));
                        return FTAIL_ERR_FILE_ACCESS;
                    }
                    _offset = 0;
                    FTAIL_DEBUG("Opened {} ({} bytes)", _path, size);
                }

                auto const n = _file.read(buffer, capacity);
                if (n == -1)
                {
                    auto const error = errno;
                    FTAIL_WARN("Could not read {} at offset {}: {}", _path, _offset, std::strerror(error));
                    return FTAIL_ERR_FILE_ACCESS;
                }
                if (n > 0)
                {
                    _offset += n;
                    out_bytesRead = static_cast<std::size_t>(n);
                    FTAIL_TRACE("Read {} bytes of {}, offset {}", n, _path, _offset);
                    return FTAIL_STATUS_OK;
                }
            }

            auto const result = _notifier->waitForChange(DATA_CHANGES, _path, _options.idleTimeout);
            if (result.status != WaitStatus::Event)
            {
                return waitFailure(result, FTAIL_ERR_IDLE_TIMEOUT);
            }

            if (result.kinds.has(ChangeKind::Remove) || result.kinds.has(ChangeKind::Rename))
            {
                FTAIL_DEBUG("{} was removed or renamed", _path);
                if (_options.closeOnDelete)
                {
                    closeFile();
                    return endOfStream();
                }
                // The existence check of the next iteration releases the handle if the
                // path no longer names the open file.
            }
        }
    }

    void TailingReader::cancel() noexcept
    {
        if (_notifier)
        {
            _notifier->cancel();
        }
    }

    ftailStatus TailingReader::close() noexcept
    {
        if (_closed)
        {
            return FTAIL_STATUS_OK;
        }

        _closed = true;
        closeFile();
        if (_notifier)
        {
            _notifier->close();
        }

        FTAIL_DEBUG("Closed reader of {}", _path);
        return FTAIL_STATUS_OK;
    }

    std::int64_t TailingReader::getOffset() const noexcept
    {
        return _offset;
    }

    TailOptions const& TailingReader::getOptions() const noexcept
    {
        return _options;
    }

    std::filesystem::path const& TailingReader::getPath() const noexcept
    {
        return _path;
    }

    bool TailingReader::isClosed() const noexcept
    {
        return _closed;
    }

    ftailStatus TailingReader::resolveFileSize(bool forceWait, std::int64_t& out_size)
    {
        for (;;)
        {
            auto status = FileStatus{};
            auto const error = queryFileStatus(_path, status);
            if (error == 0)
            {
                if (_file && (status.identity != _file.identity()))
                {
                    if (auto const result = handleDeletion("replaced"); result != FTAIL_STATUS_OK)
                    {
                        return result;
                    }
                }

                out_size = status.size;
                return FTAIL_STATUS_OK;
            }

            if (!isFileMissingError(error))
            {
                FTAIL_WARN("Could not stat {}: {}", _path, std::strerror(error));
                return FTAIL_ERR_FILE_ACCESS;
            }

            if (_file)
            {
                if (auto const result = handleDeletion("deleted"); result != FTAIL_STATUS_OK)
                {
                    return result;
                }
            }

            if (!_options.waitForFile && !forceWait)
            {
                FTAIL_DEBUG("{} does not exist", _path);
                return FTAIL_ERR_FILE_ACCESS;
            }

            FTAIL_DEBUG("Waiting for {} to be created", _path);
            auto const result = _notifier->waitForChange(ChangeKind::Create, _path, _options.waitForFileTimeout);
            if (result.status != WaitStatus::Event)
            {
                return waitFailure(result, FTAIL_ERR_WAIT_TIMEOUT);
            }
        }
    }

    ftailStatus TailingReader::handleDeletion(char const* what)
    {
        FTAIL_INFO("{} was {} while open at offset {}", _path, what, _offset);
        closeFile();
        return _options.closeOnDelete ? endOfStream() : FTAIL_STATUS_OK;
    }

    ftailStatus TailingReader::waitFailure(WaitResult const& result, ftailStatus timeoutStatus)
    {
        switch (result.status)
        {
            case WaitStatus::Timeout:
                FTAIL_DEBUG("Timed out waiting on {}", _path);
                return _options.treatTimeoutsAsEOF ? endOfStream() : timeoutStatus;

            case WaitStatus::Cancelled: FTAIL_DEBUG("Wait on {} was cancelled", _path); return FTAIL_ERR_CANCELLED;

            case WaitStatus::Error:
                FTAIL_ERROR("Change notification for {} failed: {}", _path, std::strerror(result.error));
                return FTAIL_ERR_NOTIFICATION;

            case WaitStatus::Event:
            default:                break;
        }
        return FTAIL_ERR_UNKNOWN;
    }

    ftailStatus TailingReader::endOfStream() noexcept
    {
        _endOfStream = true;
        return FTAIL_END_OF_STREAM;
    }

    void TailingReader::closeFile() noexcept
    {
        if (_file)
        {
            FTAIL_DEBUG("Releasing {} at offset {}", _path, _offset);
        }
        _file.close();
        _offset = 0;
    }
}
