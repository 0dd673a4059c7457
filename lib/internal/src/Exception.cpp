// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail-internal/Exception.hpp"

namespace ftail::lib
{
    Exception::Exception(std::string msg, ftailStatus status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    ftailStatus Exception::status() const noexcept
    {
        return _status;
    }

    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }

    SystemException::SystemException(std::string msg, ftailStatus status, int error)
        : Exception(std::move(msg), status)
        , _error(error)
    {}

    int SystemException::error() const noexcept
    {
        return _error;
    }
}
