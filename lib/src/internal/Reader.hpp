// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ftail/reader.h>
#include "ftail-internal/TailingReader.hpp"

namespace ftail::lib
{
    /** Convert the opaque C handle to the reader it stands for.  Null stays null. */
    inline TailingReader* to_TailingReader(ftailReader reader) noexcept
    {
        return reinterpret_cast<TailingReader*>(reader);
    }

    inline ftailReader to_ftailReader(TailingReader* reader) noexcept
    {
        return reinterpret_cast<ftailReader>(reader);
    }
}
