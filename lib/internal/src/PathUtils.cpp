// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/PathUtils.hpp"

namespace ftail::lib
{
    std::filesystem::path makeTargetPath(std::filesystem::path const& file)
    {
        return file.lexically_normal();
    }

    std::filesystem::path makeWatchDirectory(std::filesystem::path const& file)
    {
        auto const parent = makeTargetPath(file).parent_path();
        return parent.empty() ? std::filesystem::path{"."} : parent;
    }

    std::filesystem::path makeEventPath(std::filesystem::path const& directory, std::string_view name)
    {
        // "." / name normalises to name, matching makeTargetPath() of a bare file name.
        return (directory / name).lexically_normal();
    }
}
