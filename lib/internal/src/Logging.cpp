// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime configuration of the spdlog based logging
 *
 * The logging macros themselves are header-only (see Logging.hpp).  This
 * translation unit only applies the FTAIL_LOG_LEVEL environment variable,
 * once, the first time a reader is created.
 */

#include "ftail-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>
#include <spdlog/cfg/helpers.h>

namespace ftail::lib
{
    namespace
    {
        constexpr auto const LOG_LEVEL_ENV_VAR = "FTAIL_LOG_LEVEL";

        std::once_flag logInitFlag;
    }

    void initLogging() noexcept
    {
        try
        {
            std::call_once(logInitFlag,
                []
                {
                    if (auto const levels = std::getenv(LOG_LEVEL_ENV_VAR); (levels != nullptr) && (*levels != '\0'))
                    {
                        spdlog::cfg::helpers::load_levels(std::string{levels});
                    }
                });
        }
        catch (std::exception const& e)
        {
            // Logging is still usable at its default level.
            FTAIL_WARN("Failed to apply {}: {}", LOG_LEVEL_ENV_VAR, e.what());
        }
    }
}
