// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception types used when a reader cannot be set up
 *
 * ERROR HANDLING STRATEGY:
 * - Setup failures (notification connection, directory watch, invalid
 *   options) are reported with C++ exceptions carrying an ftailStatus
 * - Run-time outcomes of read()/waitForFile() are plain ftailStatus return
 *   values, because end of stream and timeouts are part of the normal flow
 * - At the C API boundary, exceptions are caught and converted to their status
 *
 * TWO EXCEPTION TYPES:
 * - **Exception**: ftail exception carrying an ftailStatus code
 * - **SystemException**: Extends Exception to also carry the errno of a failed system call
 *
 * USAGE PATTERN:
 * ```cpp
 * auto const fd = posixCall(::inotify_init1, "Failed to create inotify instance", IN_NONBLOCK | IN_CLOEXEC);
 * // throws SystemException(FTAIL_ERR_SETUP) on -1, otherwise continues
 * ```
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include <ftail/ftail.h>
#include <ftail/platform.h>

namespace ftail::lib
{
    /**
     * @class Exception
     * @brief Base exception class for ftail
     *
     * Factory methods use fmt::format for type-safe formatting of the message.
     */
    class FTAIL_EXPORT Exception : public std::exception
    {
    public:
        Exception(std::string msg, ftailStatus status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(ftailStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make an FTAIL_ERR_INVALID_ARG exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FTAIL_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an FTAIL_ERR_INVALID_STATE exception.
         */
        template<typename... T>
        static Exception invalidState(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(FTAIL_ERR_INVALID_STATE, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the ftailStatus code that describes the condition
         * that led to the exception being thrown.
         */
        [[nodiscard]]
        ftailStatus status() const noexcept;

        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        ftailStatus _status;
    };

    /**
     * \brief Exception raised by a failed system call.  Carries the errno
     * observed right after the failure.
     */
    class FTAIL_EXPORT SystemException : public Exception
    {
    public:
        SystemException(std::string msg, ftailStatus status, int error);

        template<typename... T>
        static SystemException make(ftailStatus status, int error, fmt::format_string<T...> fmt, T&&... args)
        {
            return SystemException(fmt::format(fmt, std::forward<T>(args)...), status, error);
        }

        [[nodiscard]]
        int error() const noexcept;

    private:
        int _error;
    };

    /**
     * \brief Call a POSIX function and check its return code.
     *
     * If the call returns -1, throws a SystemException with status FTAIL_ERR_SETUP
     * that includes errno and the message passed in as the second argument.
     */
    template<typename F, typename... T>
    auto posixCall(F fun, std::string_view msg, T... args)
    {
        auto const result = fun(args...);
        if (result == -1)
        {
            auto const error = errno;
            throw SystemException::make(FTAIL_ERR_SETUP, error, "{}: {}", msg, std::strerror(error));
        }

        return result;
    }
}
