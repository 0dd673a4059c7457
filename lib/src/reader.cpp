// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "ftail/reader.h"
#include <exception>
#include <memory>
#include <string>
#include "ftail-internal/Exception.hpp"
#include "ftail-internal/Logging.hpp"
#include "ftail-internal/ReaderOptionsParser.hpp"
#include "internal/Reader.hpp"

using namespace ftail::lib;

extern "C"
FTAIL_EXPORT
ftailStatus ftailCreateReader(char const* in_path, char const* in_options, ftailReader* out_reader)
{
    try
    {
        if ((in_path != nullptr) && (*in_path != '\0') && (out_reader != nullptr))
        {
            auto const parser = ReaderOptionsParser{(in_options != nullptr) ? std::string{in_options} : std::string{}};
            auto reader = std::make_unique<TailingReader>(in_path, parser.getOptions());
            *out_reader = to_ftailReader(reader.release());
            return FTAIL_STATUS_OK;
        }
        return FTAIL_ERR_INVALID_ARG;
    }
    catch (Exception const& e)
    {
        FTAIL_ERROR("Failed to create reader for '{}': {}", in_path, e.what());
        return e.status();
    }
    catch (std::exception const& e)
    {
        FTAIL_ERROR("Failed to create reader for '{}': {}", in_path, e.what());
        return FTAIL_ERR_UNKNOWN;
    }
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReleaseReader(ftailReader in_reader)
{
    if (auto const cppReader = to_TailingReader(in_reader); cppReader != nullptr)
    {
        auto const status = cppReader->close();
        delete cppReader;
        return status;
    }
    return FTAIL_ERR_INVALID_ARG;
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReaderRead(ftailReader in_reader, uint8_t* out_buffer, size_t in_capacity, size_t* out_bytesRead)
{
    try
    {
        if (out_bytesRead != nullptr)
        {
            *out_bytesRead = 0;
        }

        if ((out_bytesRead != nullptr) && ((out_buffer != nullptr) || (in_capacity == 0)))
        {
            if (auto const cppReader = to_TailingReader(in_reader); cppReader != nullptr)
            {
                return cppReader->read(out_buffer, in_capacity, *out_bytesRead);
            }
        }
        return FTAIL_ERR_INVALID_ARG;
    }
    catch (std::exception const& e)
    {
        FTAIL_ERROR("Read failed: {}", e.what());
        return FTAIL_ERR_UNKNOWN;
    }
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReaderWaitForFile(ftailReader in_reader, int64_t* out_size)
{
    try
    {
        if (auto const cppReader = to_TailingReader(in_reader); cppReader != nullptr)
        {
            return cppReader->waitForFile(out_size);
        }
        return FTAIL_ERR_INVALID_ARG;
    }
    catch (std::exception const& e)
    {
        FTAIL_ERROR("Waiting for file failed: {}", e.what());
        return FTAIL_ERR_UNKNOWN;
    }
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReaderCancel(ftailReader in_reader)
{
    if (auto const cppReader = to_TailingReader(in_reader); cppReader != nullptr)
    {
        cppReader->cancel();
        return FTAIL_STATUS_OK;
    }
    return FTAIL_ERR_INVALID_ARG;
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReaderGetOffset(ftailReader in_reader, int64_t* out_offset)
{
    if (auto const cppReader = to_TailingReader(in_reader); (cppReader != nullptr) && (out_offset != nullptr))
    {
        *out_offset = cppReader->getOffset();
        return FTAIL_STATUS_OK;
    }
    return FTAIL_ERR_INVALID_ARG;
}

extern "C"
FTAIL_EXPORT
ftailStatus ftailReaderGetOptions(ftailReader in_reader, ftailReaderOptions* out_options)
{
    if (auto const cppReader = to_TailingReader(in_reader); (cppReader != nullptr) && (out_options != nullptr))
    {
        auto const& options = cppReader->getOptions();
        out_options->waitForFile = options.waitForFile;
        out_options->waitForFileTimeoutNs = options.waitForFileTimeout.value;
        out_options->closeOnDelete = options.closeOnDelete;
        out_options->closeOnTruncate = options.closeOnTruncate;
        out_options->idleTimeoutNs = options.idleTimeout.value;
        out_options->treatTimeoutsAsEOF = options.treatTimeoutsAsEOF;
        return FTAIL_STATUS_OK;
    }
    return FTAIL_ERR_INVALID_ARG;
}
