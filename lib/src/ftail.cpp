// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail/ftail.h"

extern "C"
FTAIL_EXPORT
ftailStatus ftailGetVersion(ftailVersionType* out_version)
{
    if (out_version != nullptr)
    {
        out_version->major = FTAIL_VERSION_MAJOR;
        out_version->minor = FTAIL_VERSION_MINOR;
        out_version->bugfix = FTAIL_VERSION_PATCH;
        out_version->full = FTAIL_VERSION_FULL;
        return FTAIL_STATUS_OK;
    }
    return FTAIL_ERR_INVALID_ARG;
}

extern "C"
FTAIL_EXPORT
char const* ftailStatusToString(ftailStatus status)
{
    switch (status)
    {
        case FTAIL_STATUS_OK:         return "FTAIL_STATUS_OK";
        case FTAIL_END_OF_STREAM:     return "FTAIL_END_OF_STREAM";
        case FTAIL_ERR_UNKNOWN:       return "FTAIL_ERR_UNKNOWN";
        case FTAIL_ERR_INVALID_ARG:   return "FTAIL_ERR_INVALID_ARG";
        case FTAIL_ERR_INVALID_STATE: return "FTAIL_ERR_INVALID_STATE";
        case FTAIL_ERR_SETUP:         return "FTAIL_ERR_SETUP";
        case FTAIL_ERR_WAIT_TIMEOUT:  return "FTAIL_ERR_WAIT_TIMEOUT";
        case FTAIL_ERR_IDLE_TIMEOUT:  return "FTAIL_ERR_IDLE_TIMEOUT";
        case FTAIL_ERR_FILE_ACCESS:   return "FTAIL_ERR_FILE_ACCESS";
        case FTAIL_ERR_NOTIFICATION:  return "FTAIL_ERR_NOTIFICATION";
        case FTAIL_ERR_CANCELLED:     return "FTAIL_ERR_CANCELLED";
        default:                      return "FTAIL_STATUS_INVALID";
    }
}
