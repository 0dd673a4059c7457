// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/Timing.hpp"
#include <ctime>

namespace ftail::lib
{
    namespace
    {
        constexpr clockid_t clockToId(Clock clock) noexcept
        {
            switch (clock)
            {
                case Clock::Realtime:  return CLOCK_REALTIME;
                case Clock::Monotonic:
                default:               return CLOCK_MONOTONIC;
            }
        }
    }

    Timepoint currentTime(Clock clock) noexcept
    {
        auto ts = std::timespec{};
        if (::clock_gettime(clockToId(clock), &ts) == 0)
        {
            return asTimepoint(ts);
        }
        return Timepoint{};
    }
}
