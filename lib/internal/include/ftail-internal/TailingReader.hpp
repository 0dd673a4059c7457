// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TailingReader.hpp
 * @brief Blocking, byte-exact reader of a file that is still being written
 *
 * A TailingReader delivers the bytes of one file in order, as another process
 * appends them, and turns "no data yet" into a blocking wait on filesystem
 * change notifications for the parent directory of the file.
 *
 * READ ALGORITHM (one iteration of read()):
 *
 *   1. stat() the path                       missing: wait for creation, or fail
 *   2. open handle, path missing or replaced deletion: end of stream, or reopen
 *   3. offset > size                         truncation: end of stream, or reopen at 0
 *   4. offset < size                         read up to capacity bytes and return them
 *   5. otherwise                             wait for a change of the path, then loop
 *
 * The file handle is opened lazily and released on truncation, deletion and
 * rotation.  The offset counts the bytes delivered since the handle was last
 * opened, and is reset whenever the handle is (re)opened or released.
 *
 * Truncation is detected by comparing the offset with the size observed on
 * each iteration only.  A file that shrinks and grows back past the offset
 * between two iterations is indistinguishable from a file that only grew.
 * Replacement of the file by a new one (log rotation) is detected through
 * the device/inode identity of the open handle.
 *
 * Once read() or waitForFile() reported FTAIL_END_OF_STREAM, every later call
 * reports it again: no further bytes will be produced by this reader.
 *
 * THREAD SAFETY:
 * - read(), waitForFile() and close() must be called from one thread at a time
 * - cancel() may be called from any thread, as long as close() is not running
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ftail/ftail.h>
#include <ftail/platform.h>
#include "ftail-internal/ChangeNotifier.hpp"
#include "ftail-internal/FileHandle.hpp"
#include "ftail-internal/TailOptions.hpp"

namespace ftail::lib
{
    class FTAIL_EXPORT TailingReader
    {
    public:
        /**
         * Tail \p path using inotify.
         *
         * @param path File to tail.  It does not need to exist yet; its parent directory does.
         * @param options Reader configuration
         * @throws Exception (FTAIL_ERR_INVALID_ARG) if \p path does not name a file
         * @throws SystemException (FTAIL_ERR_SETUP) if the parent directory cannot be watched
         */
        explicit TailingReader(std::filesystem::path const& path, TailOptions const& options = defaultTailOptions());

        /**
         * Tail \p path using the given notification source.  The reader takes
         * ownership of \p notifier and calls its watch() on the parent directory.
         */
        TailingReader(std::filesystem::path const& path, TailOptions const& options, std::unique_ptr<ChangeNotifier> notifier);

        TailingReader(TailingReader const&) = delete;
        TailingReader& operator=(TailingReader const&) = delete;

        ~TailingReader();

        /**
         * Block until the file exists, regardless of TailOptions::waitForFile,
         * bounded by TailOptions::waitForFileTimeout.
         *
         * @param out_size Optional.  Receives the size of the file.
         * @return FTAIL_STATUS_OK, FTAIL_END_OF_STREAM, FTAIL_ERR_WAIT_TIMEOUT, FTAIL_ERR_FILE_ACCESS,
         *         FTAIL_ERR_NOTIFICATION, FTAIL_ERR_CANCELLED or FTAIL_ERR_INVALID_STATE
         */
        ftailStatus waitForFile(std::int64_t* out_size = nullptr);

        /**
         * Read the next bytes of the file, blocking until at least one is available.
         * FTAIL_ERR_NOTIFICATION is permanent: every later call that needs to
         * wait returns it again.
         *
         * @param buffer Destination
         * @param capacity Size of \p buffer.  0 returns FTAIL_STATUS_OK immediately.
         * @param out_bytesRead Number of bytes stored in \p buffer; 0 unless FTAIL_STATUS_OK is returned
         */
        ftailStatus read(std::uint8_t* buffer, std::size_t capacity, std::size_t& out_bytesRead);

        /** Interrupt a blocking read() or waitForFile().  See ChangeNotifier::cancel(). */
        void cancel() noexcept;

        /**
         * Release the notification source and the file handle.  Later calls do
         * nothing; every other operation then fails with FTAIL_ERR_INVALID_STATE.
         */
        ftailStatus close() noexcept;

        [[nodiscard]]
        std::int64_t getOffset() const noexcept;

        [[nodiscard]]
        TailOptions const& getOptions() const noexcept;

        [[nodiscard]]
        std::filesystem::path const& getPath() const noexcept;

        [[nodiscard]]
        bool isClosed() const noexcept;

    private:
        /**
         * Existence check of the file, waiting for it to be created when
         * configured to (or when \p forceWait is set).
         *
         * Also releases the handle when the path no longer names the open file.
         *
         * @param out_size Receives the current size of the file on FTAIL_STATUS_OK
         */
        ftailStatus resolveFileSize(bool forceWait, std::int64_t& out_size);

        /** The file named by the path went away, or was replaced.  Returns FTAIL_STATUS_OK to carry on. */
        ftailStatus handleDeletion(char const* what);

        /** Map a non-event wait result to the status returned to the caller. */
        ftailStatus waitFailure(WaitResult const& result, ftailStatus timeoutStatus);

        ftailStatus endOfStream() noexcept;

        void closeFile() noexcept;

        std::filesystem::path _path;
        TailOptions _options;
        std::unique_ptr<ChangeNotifier> _notifier;
        FileHandle _file;
        std::int64_t _offset;
        bool _endOfStream;
        bool _closed;
    };
}
