// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/InotifyChangeNotifier.hpp"
#include <array>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include "ftail-internal/Exception.hpp"
#include "ftail-internal/Logging.hpp"
#include "ftail-internal/PathUtils.hpp"

namespace ftail::lib
{
    namespace
    {
        constexpr auto const WATCH_MASK = std::uint32_t{IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB |
                                                        IN_DELETE_SELF | IN_MOVE_SELF};

        constexpr ChangeMask toChangeMask(std::uint32_t mask) noexcept
        {
            auto result = ChangeMask{};
            if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0U)
            {
                result |= ChangeKind::Create;
            }
            if ((mask & IN_MODIFY) != 0U)
            {
                result |= ChangeKind::Write;
            }
            if ((mask & (IN_DELETE | IN_DELETE_SELF)) != 0U)
            {
                result |= ChangeKind::Remove;
            }
            if ((mask & (IN_MOVED_FROM | IN_MOVE_SELF)) != 0U)
            {
                result |= ChangeKind::Rename;
            }
            if ((mask & IN_ATTRIB) != 0U)
            {
                result |= ChangeKind::AttributeChange;
            }
            return result;
        }

        void closeDescriptor(int& fd) noexcept
        {
            if (fd != -1)
            {
                ::close(fd);
                fd = -1;
            }
        }

        void addToEpoll(int epollFd, int fd)
        {
            auto event = ::epoll_event{};
            event.events = EPOLLIN;
            event.data.fd = fd;
            posixCall(::epoll_ctl, "Could not register descriptor with epoll", epollFd, EPOLL_CTL_ADD, fd, &event);
        }
    }

    InotifyChangeNotifier::InotifyChangeNotifier()
        : _inotifyFd{-1}
        , _epollFd{-1}
        , _cancelFd{-1}
        , _watchDescriptor{-1}
        , _failure{0}
        , _directory{}
        , _pending{}
    {
        try
        {
            _inotifyFd = posixCall(::inotify_init1, "Could not create inotify instance", IN_NONBLOCK | IN_CLOEXEC);
            _epollFd = posixCall(::epoll_create1, "Could not create epoll instance", EPOLL_CLOEXEC);
            _cancelFd = posixCall(::eventfd, "Could not create cancellation eventfd", 0U, EFD_NONBLOCK | EFD_CLOEXEC);

            addToEpoll(_epollFd, _inotifyFd);
            addToEpoll(_epollFd, _cancelFd);
        }
        catch (SystemException const&)
        {
            close();
            throw;
        }
    }

    InotifyChangeNotifier::~InotifyChangeNotifier()
    {
        close();
    }

    void InotifyChangeNotifier::watch(std::filesystem::path const& directory)
    {
        if (_inotifyFd == -1)
        {
            throw Exception::invalidState("Cannot watch {} with a closed notifier", directory);
        }

        if (_watchDescriptor != -1)
        {
            ::inotify_rm_watch(_inotifyFd, _watchDescriptor);
            _watchDescriptor = -1;
        }
        _pending.clear();
        _failure = 0;

        auto const message = fmt::format("Could not watch directory {}", directory);
        _watchDescriptor = posixCall(::inotify_add_watch, message, _inotifyFd, directory.c_str(), WATCH_MASK);
        _directory = makeTargetPath(directory);

        FTAIL_DEBUG("Watching directory {} (wd {})", _directory, _watchDescriptor);
    }

    WaitResult InotifyChangeNotifier::waitForChange(ChangeMask kinds, std::filesystem::path const& path, Duration timeout)
    {
        if (_inotifyFd == -1)
        {
            return {WaitStatus::Error, {}, EBADF};
        }
        if (_failure != 0)
        {
            return {WaitStatus::Error, {}, _failure};
        }

        auto const infinite = (timeout <= Duration{});
        auto const deadline = infinite ? Timepoint{} : currentTime(Clock::Monotonic) + timeout;

        for (;;)
        {
            if (consumeCancellation())
            {
                return {WaitStatus::Cancelled, {}, 0};
            }

            while (!_pending.empty())
            {
                auto const change = std::move(_pending.front());
                _pending.pop_front();

                if (change.error != 0)
                {
                    return fail(change.error);
                }
                if (change.event.kinds.isSubsetOf(kinds) && (change.event.path == path))
                {
                    return {WaitStatus::Event, change.event.kinds, 0};
                }
                FTAIL_TRACE("Ignoring change 0x{:x} of {}", change.event.kinds.bits(), change.event.path);
            }

            auto timeoutMs = -1;
            if (!infinite)
            {
                auto const remaining = deadline - currentTime(Clock::Monotonic);
                if (remaining <= Duration{})
                {
                    return {WaitStatus::Timeout, {}, 0};
                }
                timeoutMs = static_cast<int>(std::min<std::int64_t>(inMilliSecondsRoundedUp(remaining), INT_MAX));
            }

            auto events = std::array<::epoll_event, 2>{};
            auto const count = ::epoll_wait(_epollFd, events.data(), static_cast<int>(events.size()), timeoutMs);
            if (count == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return fail(errno);
            }

            for (auto i = 0; i < count; ++i)
            {
                if (events[i].data.fd == _inotifyFd)
                {
                    if (auto const error = readEvents(); error != 0)
                    {
                        return fail(error);
                    }
                }
                // The cancellation eventfd is consumed at the top of the loop.
            }
        }
    }

    void InotifyChangeNotifier::cancel() noexcept
    {
        if (_cancelFd == -1)
        {
            return;
        }

        auto const value = std::uint64_t{1};
        if (::write(_cancelFd, &value, sizeof value) != static_cast<::ssize_t>(sizeof value))
        {
            auto const error = errno;
            FTAIL_WARN("Failed to signal cancellation: {}", std::strerror(error));
        }
    }

    void InotifyChangeNotifier::close() noexcept
    {
        if ((_inotifyFd != -1) && (_watchDescriptor != -1))
        {
            ::inotify_rm_watch(_inotifyFd, _watchDescriptor);
        }
        _watchDescriptor = -1;
        _failure = 0;
        _pending.clear();

        closeDescriptor(_cancelFd);
        closeDescriptor(_epollFd);
        closeDescriptor(_inotifyFd);
    }

    WaitResult InotifyChangeNotifier::fail(int error) noexcept
    {
        _pending.clear();
        _failure = error;
        return {WaitStatus::Error, {}, error};
    }

    bool InotifyChangeNotifier::consumeCancellation() noexcept
    {
        auto value = std::uint64_t{};
        // Reading resets the eventfd counter: any number of cancel() calls is consumed by one wait.
        return ::read(_cancelFd, &value, sizeof value) == static_cast<::ssize_t>(sizeof value);
    }

    int InotifyChangeNotifier::readEvents()
    {
        alignas(::inotify_event) std::array<char, 8192> buffer;

        for (;;)
        {
            auto const n = ::read(_inotifyFd, buffer.data(), buffer.size());
            if (n == -1)
            {
                auto const error = errno;
                if (error == EINTR)
                {
                    continue;
                }
                return ((error == EAGAIN) || (error == EWOULDBLOCK)) ? 0 : error;
            }
            if (n == 0)
            {
                return 0;
            }

            processEventBuffer(buffer.data(), static_cast<std::size_t>(n));
        }
    }

    void InotifyChangeNotifier::processEventBuffer(char const* buffer, std::size_t count)
    {
        for (auto offset = std::size_t{0}; offset < count;)
        {
            auto const event = reinterpret_cast<::inotify_event const*>(buffer + offset);
            offset += sizeof(::inotify_event) + event->len;

            if ((event->mask & IN_Q_OVERFLOW) != 0U)
            {
                FTAIL_WARN("inotify event queue overflowed on {}", _directory);
                _pending.push_back({{}, ENOSPC});
                continue;
            }
            if (event->wd != _watchDescriptor)
            {
                continue;
            }
            if ((event->mask & IN_IGNORED) != 0U)
            {
                FTAIL_WARN("Watch on {} was removed by the kernel", _directory);
                _watchDescriptor = -1;
                _pending.push_back({{}, ENOENT});
                continue;
            }

            auto const kinds = toChangeMask(event->mask);
            if (kinds.empty())
            {
                continue;
            }

            auto path = (event->len > 0U) ? makeEventPath(_directory, std::string_view{event->name}) : _directory;
            FTAIL_TRACE("Change 0x{:x} of {}", kinds.bits(), path);
            _pending.push_back({{std::move(path), kinds}, 0});
        }
    }
}
