// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/FileHandle.hpp"
#include <cerrno>
#include <utility>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace ftail::lib
{
    namespace
    {
        constexpr FileIdentity makeIdentity(struct ::stat const& st) noexcept
        {
            return FileIdentity{st.st_dev, st.st_ino};
        }
    }

    int queryFileStatus(std::filesystem::path const& path, FileStatus& out_status) noexcept
    {
        struct ::stat st{};
        if (::stat(path.c_str(), &st) != 0)
        {
            return errno;
        }

        out_status.size = static_cast<std::int64_t>(st.st_size);
        out_status.identity = makeIdentity(st);
        return 0;
    }

    FileHandle::FileHandle(FileHandle&& other) noexcept
        : _fd{std::exchange(other._fd, -1)}
        , _identity{other._identity}
    {}

    FileHandle& FileHandle::operator=(FileHandle&& other) noexcept
    {
        if (this != &other)
        {
            close();
            _fd = std::exchange(other._fd, -1);
            _identity = other._identity;
        }
        return *this;
    }

    FileHandle::~FileHandle()
    {
        close();
    }

    int FileHandle::open(std::filesystem::path const& path) noexcept
    {
        close();

        auto const fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            return errno;
        }

        struct ::stat st{};
        if (::fstat(fd, &st) != 0)
        {
            auto const error = errno;
            ::close(fd);
            return error;
        }

        _fd = fd;
        _identity = makeIdentity(st);
        return 0;
    }

    ::ssize_t FileHandle::read(void* buffer, std::size_t capacity) noexcept
    {
        for (;;)
        {
            auto const n = ::read(_fd, buffer, capacity);
            if ((n == -1) && (errno == EINTR))
            {
                continue;
            }
            return n;
        }
    }

    void FileHandle::close() noexcept
    {
        if (_fd != -1)
        {
            ::close(_fd);
            _fd = -1;
            _identity = FileIdentity{};
        }
    }
}
