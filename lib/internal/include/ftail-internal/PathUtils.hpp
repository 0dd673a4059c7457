// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file PathUtils.hpp
 * @brief Path helpers shared by the reader and the change notifiers
 *
 * The reader compares the path carried by every change event with the path
 * of the file it tails.  Both sides must therefore spell paths the same way,
 * which is what these helpers guarantee:
 *
 *   makeTargetPath("./logs//capture.bin")            -> "logs/capture.bin"
 *   makeWatchDirectory("logs/capture.bin")           -> "logs"
 *   makeWatchDirectory("capture.bin")                -> "."
 *   makeEventPath("logs", "capture.bin")             -> "logs/capture.bin"
 *   makeEventPath(".", "capture.bin")                -> "capture.bin"
 */

#pragma once

#include <filesystem>
#include <string_view>
#include <ftail/platform.h>

namespace ftail::lib
{
    /** Lexically normalised form of the path of a tailed file. */
    FTAIL_EXPORT
    std::filesystem::path makeTargetPath(std::filesystem::path const& file);

    /** Directory to watch for a tailed file: its parent, or "." for a bare file name. */
    FTAIL_EXPORT
    std::filesystem::path makeWatchDirectory(std::filesystem::path const& file);

    /** Normalised path of a directory entry named in a change event. */
    FTAIL_EXPORT
    std::filesystem::path makeEventPath(std::filesystem::path const& directory, std::string_view name);
}
