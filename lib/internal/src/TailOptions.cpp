// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/TailOptions.hpp"

namespace ftail::lib
{
    TailOption withWaitForFile(bool wait, Duration timeout)
    {
        return [wait, timeout](TailOptions& options)
        {
            options.waitForFile = wait;
            options.waitForFileTimeout = timeout;
        };
    }

    TailOption withCloseOnDelete(bool close)
    {
        return [close](TailOptions& options)
        {
            options.closeOnDelete = close;
        };
    }

    TailOption withCloseOnTruncate(bool close)
    {
        return [close](TailOptions& options)
        {
            options.closeOnTruncate = close;
        };
    }

    TailOption withIdleTimeout(Duration timeout)
    {
        return [timeout](TailOptions& options)
        {
            options.idleTimeout = timeout;
        };
    }

    TailOption withTimeoutsAsEOF(bool timeoutsAsEOF)
    {
        return [timeoutsAsEOF](TailOptions& options)
        {
            options.treatTimeoutsAsEOF = timeoutsAsEOF;
        };
    }

    TailOptions makeTailOptions(std::initializer_list<TailOption> options)
    {
        auto result = TailOptions{};
        applyTailOptions(result, options);
        return result;
    }

    void applyTailOptions(TailOptions& inout_options, std::initializer_list<TailOption> options)
    {
        for (auto const& option : options)
        {
            if (option)
            {
                option(inout_options);
            }
        }
    }
}
