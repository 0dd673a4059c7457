// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Timing.hpp
 * @brief Nanosecond time values used for reader timeouts and deadlines
 *
 * Two value types, both thin wrappers around an int64_t nanosecond count:
 * - Duration: a timeout (waitForFileTimeout, idleTimeout).  Non-positive
 *   values mean "no timeout" wherever a timeout is accepted
 * - Timepoint: a reading of one of the system clocks
 *
 * A deadline is computed once per wait as currentTime(Clock::Monotonic) +
 * timeout, so that wall-clock adjustments never shorten or stretch a wait,
 * and the time left is re-derived from it after every wakeup.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <limits>
#include <ftail/platform.h>

namespace ftail::lib
{
    enum class Clock
    {
        Monotonic, // Unaffected by system time changes, used for deadlines
        Realtime,  // Wall-clock time
    };

    struct Duration
    {
        std::int64_t value{0}; // Nanoseconds

        constexpr Duration() noexcept = default;

        constexpr explicit Duration(std::int64_t nanoSeconds) noexcept
            : value{nanoSeconds}
        {}

        constexpr explicit operator bool() const noexcept
        {
            return value != 0;
        }

        friend constexpr bool operator==(Duration lhs, Duration rhs) noexcept
        {
            return lhs.value == rhs.value;
        }

        friend constexpr bool operator!=(Duration lhs, Duration rhs) noexcept
        {
            return lhs.value != rhs.value;
        }

        friend constexpr bool operator<=(Duration lhs, Duration rhs) noexcept
        {
            return lhs.value <= rhs.value;
        }

        friend constexpr bool operator>=(Duration lhs, Duration rhs) noexcept
        {
            return lhs.value >= rhs.value;
        }
    };

    struct Timepoint
    {
        std::int64_t value{0}; // Nanoseconds since the epoch of the clock it was read from

        constexpr Timepoint() noexcept = default;

        constexpr explicit Timepoint(std::int64_t nanoSeconds) noexcept
            : value{nanoSeconds}
        {}

        /** False for the zero timepoint, which currentTime() returns on failure. */
        constexpr explicit operator bool() const noexcept
        {
            return value != 0;
        }

        friend constexpr bool operator==(Timepoint lhs, Timepoint rhs) noexcept
        {
            return lhs.value == rhs.value;
        }

        friend constexpr bool operator>=(Timepoint lhs, Timepoint rhs) noexcept
        {
            return lhs.value >= rhs.value;
        }

        /** Time elapsed from rhs to lhs; negative if rhs is later. */
        friend constexpr Duration operator-(Timepoint lhs, Timepoint rhs) noexcept
        {
            return Duration{lhs.value - rhs.value};
        }

        /**
         * Clamped to [0, INT64_MAX].  A deadline that does not fit saturates
         * at the largest timepoint and is never reached.
         */
        friend constexpr Timepoint operator+(Timepoint lhs, Duration rhs) noexcept
        {
            if ((rhs.value > 0) && (lhs.value > (std::numeric_limits<std::int64_t>::max() - rhs.value)))
            {
                return Timepoint{std::numeric_limits<std::int64_t>::max()};
            }
            if ((rhs.value < 0) && (lhs.value < (std::numeric_limits<std::int64_t>::min() - rhs.value)))
            {
                return Timepoint{0};
            }
            auto const sum = lhs.value + rhs.value;
            return Timepoint{(sum > 0) ? sum : 0};
        }
    };

    /**
     * Read the given system clock.
     *
     * @return The current time, or a zero Timepoint if the clock cannot be read
     */
    [[nodiscard]]
    FTAIL_EXPORT
    Timepoint currentTime(Clock clock) noexcept;

    constexpr Timepoint asTimepoint(std::timespec const& ts) noexcept
    {
        return Timepoint{(static_cast<std::int64_t>(ts.tv_sec) * 1'000'000'000LL) + ts.tv_nsec};
    }

    /** Nanoseconds as a Duration, saturating at the int64_t range.  NaN yields zero. */
    constexpr Duration saturatingDuration(double nanoSeconds) noexcept
    {
        // 2^63 is exactly representable, INT64_MAX is not.
        constexpr auto limit = 9'223'372'036'854'775'808.0;
        if (!(nanoSeconds == nanoSeconds))
        {
            return Duration{};
        }
        if (nanoSeconds >= limit)
        {
            return Duration{std::numeric_limits<std::int64_t>::max()};
        }
        if (nanoSeconds <= -limit)
        {
            return Duration{std::numeric_limits<std::int64_t>::min()};
        }
        return Duration{static_cast<std::int64_t>(nanoSeconds)};
    }

    constexpr Duration fromSeconds(double seconds) noexcept
    {
        return saturatingDuration(seconds * 1'000'000'000.0);
    }

    constexpr Duration fromMilliSeconds(double milliSeconds) noexcept
    {
        return saturatingDuration(milliSeconds * 1'000'000.0);
    }

    constexpr Duration fromNanoSeconds(std::int64_t nanoSeconds) noexcept
    {
        return Duration{nanoSeconds};
    }

    constexpr double inMilliSeconds(Duration duration) noexcept
    {
        return static_cast<double>(duration.value) / 1'000'000.0;
    }

    /**
     * Whole milliseconds in a duration, rounded up, for epoll_wait().  A
     * positive duration below one millisecond must not become a zero
     * (non-blocking) timeout.  Non-positive durations yield 0.
     */
    constexpr std::int64_t inMilliSecondsRoundedUp(Duration duration) noexcept
    {
        return (duration.value > 0) ? ((duration.value + 999'999LL) / 1'000'000LL) : 0;
    }
}
