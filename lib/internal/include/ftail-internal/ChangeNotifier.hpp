// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ChangeNotifier.hpp
 * @brief Abstract source of filesystem change notifications for one directory
 *
 * The TailingReader never talks to inotify directly.  It asks a
 * ChangeNotifier to block until something of interest happens to the tailed
 * path, which allows:
 * - a Linux implementation built on inotify + epoll (InotifyChangeNotifier)
 * - scripted implementations in the unit tests
 *
 * FILTERING:
 * An event matches a call to waitForChange() when BOTH hold:
 * - every kind reported by the event is part of the requested kinds
 * - the event path equals the requested path exactly
 * Events that do not match are consumed and discarded.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <ftail/platform.h>
#include "ftail-internal/Timing.hpp"

namespace ftail::lib
{
    /** Kind of change reported for a directory entry. */
    enum class ChangeKind : std::uint32_t
    {
        Create = 1U << 0,
        Write = 1U << 1,
        Remove = 1U << 2,
        Rename = 1U << 3,
        AttributeChange = 1U << 4,
    };

    /** Set of ChangeKind values. */
    class ChangeMask
    {
    public:
        constexpr ChangeMask() noexcept = default;

        constexpr ChangeMask(ChangeKind kind) noexcept
            : _bits{static_cast<std::uint32_t>(kind)}
        {}

        [[nodiscard]]
        constexpr bool has(ChangeKind kind) const noexcept
        {
            return (_bits & static_cast<std::uint32_t>(kind)) != 0U;
        }

        /** True if this set is empty or every kind in it is also in \p other. */
        [[nodiscard]]
        constexpr bool isSubsetOf(ChangeMask other) const noexcept
        {
            return (_bits & other._bits) == _bits;
        }

        [[nodiscard]]
        constexpr bool empty() const noexcept
        {
            return _bits == 0U;
        }

        [[nodiscard]]
        constexpr std::uint32_t bits() const noexcept
        {
            return _bits;
        }

        constexpr ChangeMask& operator|=(ChangeMask other) noexcept
        {
            _bits |= other._bits;
            return *this;
        }

        [[nodiscard]]
        friend constexpr ChangeMask operator|(ChangeMask lhs, ChangeMask rhs) noexcept
        {
            return lhs |= rhs;
        }

        [[nodiscard]]
        friend constexpr bool operator==(ChangeMask lhs, ChangeMask rhs) noexcept
        {
            return lhs._bits == rhs._bits;
        }

        [[nodiscard]]
        friend constexpr bool operator!=(ChangeMask lhs, ChangeMask rhs) noexcept
        {
            return lhs._bits != rhs._bits;
        }

    private:
        std::uint32_t _bits{0U};
    };

    [[nodiscard]]
    constexpr ChangeMask operator|(ChangeKind lhs, ChangeKind rhs) noexcept
    {
        return ChangeMask{lhs} | ChangeMask{rhs};
    }

    /** One change delivered by the notification source. */
    struct ChangeEvent
    {
        std::filesystem::path path;
        ChangeMask kinds;
    };

    enum class WaitStatus
    {
        Event,     // A matching event arrived; see WaitResult::kinds
        Timeout,   // The timeout expired first
        Error,     // The notification source failed; see WaitResult::error
        Cancelled, // cancel() was called
    };

    struct WaitResult
    {
        WaitStatus status{WaitStatus::Timeout};
        ChangeMask kinds{};
        int error{0};
    };

    class FTAIL_EXPORT ChangeNotifier
    {
    public:
        virtual ~ChangeNotifier();

        /**
         * Start receiving changes to the entries of \p directory.
         *
         * @throws Exception (FTAIL_ERR_SETUP) if the watch cannot be established
         */
        virtual void watch(std::filesystem::path const& directory) = 0;

        /**
         * Block until an event matching \p kinds and \p path arrives.
         *
         * @param kinds Kinds of change of interest
         * @param path Normalised path of the entry of interest (see makeTargetPath())
         * @param timeout Upper bound on the wait; non-positive waits indefinitely
         */
        virtual WaitResult waitForChange(ChangeMask kinds, std::filesystem::path const& path, Duration timeout) = 0;

        /**
         * Wake up a thread blocked in waitForChange(), which then returns
         * WaitStatus::Cancelled.  If no thread is blocked, the next call
         * to waitForChange() returns WaitStatus::Cancelled immediately.
         * May be called from any thread.
         */
        virtual void cancel() noexcept = 0;

        /** Stop watching and release all resources.  Idempotent. */
        virtual void close() noexcept = 0;
    };
}
