// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/ChangeNotifier.hpp"

namespace ftail::lib
{
    ChangeNotifier::~ChangeNotifier() = default;
}
