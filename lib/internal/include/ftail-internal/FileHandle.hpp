// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FileHandle.hpp
 * @brief Owned, read-only POSIX file descriptor of the tailed file
 *
 * Lifecycle:
 * - open() opens the file read-only and records its identity (device + inode)
 * - read() reads sequentially from the current position, retrying on EINTR
 * - close() (or the destructor) releases the descriptor
 * - Move semantics supported (ownership transfer)
 * - Copy semantics deleted (can't have two owners of the same fd)
 *
 * The recorded identity lets the reader notice that the path now names a
 * different file (log rotation: rename + create) while the old one is still
 * open.
 */

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <sys/types.h>
#include <ftail/platform.h>

namespace ftail::lib
{
    /** Identity of a file on a mounted filesystem. */
    struct FileIdentity
    {
        ::dev_t device{};
        ::ino_t inode{};

        [[nodiscard]]
        constexpr bool operator==(FileIdentity const& other) const noexcept
        {
            return (device == other.device) && (inode == other.inode);
        }

        [[nodiscard]]
        constexpr bool operator!=(FileIdentity const& other) const noexcept
        {
            return !(*this == other);
        }
    };

    /** Result of a stat() on the tailed path. */
    struct FileStatus
    {
        std::int64_t size{};
        FileIdentity identity{};
    };

    /**
     * stat() the path.
     *
     * @param path File to query
     * @param out_status Receives size and identity on success
     * @return 0 on success, the errno value of the failed stat() otherwise
     */
    FTAIL_EXPORT
    int queryFileStatus(std::filesystem::path const& path, FileStatus& out_status) noexcept;

    /** errno values meaning "the file does not exist (yet)" for a stat() or open(). */
    [[nodiscard]]
    constexpr bool isFileMissingError(int error) noexcept;

    class FTAIL_EXPORT FileHandle
    {
    public:
        constexpr FileHandle() noexcept = default;

        FileHandle(FileHandle&& other) noexcept;
        FileHandle& operator=(FileHandle&& other) noexcept;

        FileHandle(FileHandle const&) = delete;
        FileHandle& operator=(FileHandle const&) = delete;

        ~FileHandle();

        /**
         * Open the file read-only, closing any descriptor held before.
         *
         * @return 0 on success, the errno value of the failed open()/fstat() otherwise
         */
        int open(std::filesystem::path const& path) noexcept;

        /**
         * Read up to capacity bytes from the current position.
         *
         * @return Number of bytes read (0 at end of file), or -1 with errno set
         */
        [[nodiscard]]
        ::ssize_t read(void* buffer, std::size_t capacity) noexcept;

        /** Release the descriptor.  No-op if not open. */
        void close() noexcept;

        [[nodiscard]]
        constexpr bool isOpen() const noexcept
        {
            return (_fd != -1);
        }

        [[nodiscard]]
        constexpr explicit operator bool() const noexcept
        {
            return isOpen();
        }

        /** Identity recorded when the file was opened. */
        [[nodiscard]]
        constexpr FileIdentity const& identity() const noexcept
        {
            return _identity;
        }

    private:
        int _fd{-1};
        FileIdentity _identity{};
    };

    constexpr bool isFileMissingError(int error) noexcept
    {
        return (error == ENOENT) || (error == ENOTDIR);
    }
}
