// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file InotifyChangeNotifier.hpp
 * @brief Linux ChangeNotifier built on inotify, epoll and an eventfd
 *
 * OPERATION:
 * 1. The constructor creates a non-blocking inotify instance, an epoll
 *    instance and an eventfd, and registers both descriptors with epoll
 * 2. watch() adds an inotify watch on the parent directory of the tailed file
 * 3. waitForChange() blocks in epoll_wait() until inotify has events, the
 *    eventfd was signalled by cancel(), or the deadline passes
 * 4. Raw inotify events are translated into ChangeEvents and queued in
 *    delivery order, then consumed one at a time against the caller's filter
 *
 * EVENT MAPPING:
 * - IN_CREATE, IN_MOVED_TO        -> Create
 * - IN_MODIFY                     -> Write
 * - IN_DELETE, IN_DELETE_SELF     -> Remove
 * - IN_MOVED_FROM, IN_MOVE_SELF   -> Rename
 * - IN_ATTRIB                     -> AttributeChange
 * - IN_Q_OVERFLOW                 -> error (ENOSPC): events were lost
 * - IN_IGNORED                    -> error (ENOENT): the directory watch is gone
 *
 * Events for the watched directory itself carry the directory path.
 *
 * ERRORS:
 * Once a wait has reported WaitStatus::Error, every later wait reports the
 * same error without blocking.  Only a new watch() clears it.
 *
 * THREAD SAFETY:
 * - waitForChange(), watch() and close() must be called from one thread at a time
 * - cancel() may be called from any thread while the notifier is open
 */

#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <sys/inotify.h>
#include <ftail/platform.h>
#include "ftail-internal/ChangeNotifier.hpp"

namespace ftail::lib
{
    class FTAIL_EXPORT InotifyChangeNotifier final : public ChangeNotifier
    {
    public:
        /**
         * Create the inotify, epoll and eventfd descriptors.
         *
         * @throws SystemException (FTAIL_ERR_SETUP) if any of them cannot be created
         */
        InotifyChangeNotifier();

        InotifyChangeNotifier(InotifyChangeNotifier const&) = delete;
        InotifyChangeNotifier& operator=(InotifyChangeNotifier const&) = delete;

        ~InotifyChangeNotifier() override;

        /**
         * Watch the entries of \p directory.  Replaces any previous watch,
         * drops the events queued for it and clears a latched error.
         *
         * @throws SystemException (FTAIL_ERR_SETUP) if inotify_add_watch() fails
         * @throws Exception (FTAIL_ERR_INVALID_STATE) if the notifier was closed
         */
        void watch(std::filesystem::path const& directory) override;

        WaitResult waitForChange(ChangeMask kinds, std::filesystem::path const& path, Duration timeout) override;

        void cancel() noexcept override;

        void close() noexcept override;

    private:
        /** A queued event, or a transport error (error != 0) at its place in the stream. */
        struct PendingChange
        {
            ChangeEvent event;
            int error;
        };

        /** Latch \p error so that every later wait reports it. */
        WaitResult fail(int error) noexcept;

        /** Consume a pending cancellation request, if any. */
        bool consumeCancellation() noexcept;

        /**
         * Read every event available on the inotify descriptor into _pending.
         *
         * @return 0, or the errno of the failed read()
         */
        int readEvents();

        void processEventBuffer(char const* buffer, std::size_t count);

        int _inotifyFd;
        int _epollFd;
        int _cancelFd;
        int _watchDescriptor;
        int _failure; // errno of the last transport error, 0 if none
        std::filesystem::path _directory;
        std::deque<PendingChange> _pending;
    };
}
