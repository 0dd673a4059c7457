// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_reader_api.cpp
 * @brief Tests of the public C API (<ftail/reader.h>, <ftail/ftail.h>)
 *
 * Covers argument validation, JSON options, error mapping of construction
 * failures, and a complete read until end of stream.
 */

#include <cstdint>
#include <cstring>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include <ftail/ftail.h>
#include <ftail/reader.h>
#include "Utils.hpp"

TEST_CASE("Version", "[api]")
{
    auto version = ::ftailVersionType{};
    REQUIRE(::ftailGetVersion(&version) == FTAIL_STATUS_OK);
    REQUIRE(version.full != nullptr);
    REQUIRE(std::string{version.full} == std::to_string(version.major) + "." + std::to_string(version.minor) + "." +
                                             std::to_string(version.bugfix));
    REQUIRE(::ftailGetVersion(nullptr) == FTAIL_ERR_INVALID_ARG);
}

TEST_CASE("Status names", "[api]")
{
    REQUIRE(std::strcmp(::ftailStatusToString(FTAIL_STATUS_OK), "FTAIL_STATUS_OK") == 0);
    REQUIRE(std::strcmp(::ftailStatusToString(FTAIL_END_OF_STREAM), "FTAIL_END_OF_STREAM") == 0);
    REQUIRE(std::strcmp(::ftailStatusToString(FTAIL_ERR_IDLE_TIMEOUT), "FTAIL_ERR_IDLE_TIMEOUT") == 0);
    REQUIRE(::ftailStatusToString(static_cast<ftailStatus>(1000)) != nullptr);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Null arguments are rejected", "[api]")
{
    auto const path = (directory / "capture.bin").string();
    auto reader = ::ftailReader{nullptr};

    REQUIRE(::ftailCreateReader(nullptr, "", &reader) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailCreateReader("", "", &reader) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailCreateReader(path.c_str(), "", nullptr) == FTAIL_ERR_INVALID_ARG);

    auto bytesRead = std::size_t{0};
    auto buffer = std::uint8_t{};
    auto value = std::int64_t{};
    auto options = ::ftailReaderOptions{};
    REQUIRE(::ftailReaderRead(nullptr, &buffer, 1, &bytesRead) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderWaitForFile(nullptr, &value) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderCancel(nullptr) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderGetOffset(nullptr, &value) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderGetOptions(nullptr, &options) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReleaseReader(nullptr) == FTAIL_ERR_INVALID_ARG);

    REQUIRE(::ftailCreateReader(path.c_str(), nullptr, &reader) == FTAIL_STATUS_OK);
    REQUIRE(::ftailReaderRead(reader, nullptr, 1, &bytesRead) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderRead(reader, &buffer, 1, nullptr) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderRead(reader, nullptr, 0, &bytesRead) == FTAIL_STATUS_OK);
    REQUIRE(::ftailReaderGetOffset(reader, nullptr) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReaderGetOptions(reader, nullptr) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailReleaseReader(reader) == FTAIL_STATUS_OK);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Construction errors are mapped to status codes", "[api]")
{
    auto reader = ::ftailReader{nullptr};
    auto const path = (directory / "capture.bin").string();
    auto const missing = (directory / "missing" / "capture.bin").string();

    REQUIRE(::ftailCreateReader(path.c_str(), "{not json", &reader) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailCreateReader(path.c_str(), R"({"idleTimeoutMs": -5})", &reader) == FTAIL_ERR_INVALID_ARG);
    REQUIRE(::ftailCreateReader(missing.c_str(), "", &reader) == FTAIL_ERR_SETUP);
    REQUIRE(reader == nullptr);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Effective options", "[api]")
{
    auto const path = (directory / "capture.bin").string();

    auto reader = ::ftailReader{nullptr};
    REQUIRE(::ftailCreateReader(path.c_str(), R"({"waitForFileTimeoutMs": 30000, "closeOnDelete": true, "idleTimeoutMs": 60000})", &reader) ==
            FTAIL_STATUS_OK);

    auto options = ::ftailReaderOptions{};
    REQUIRE(::ftailReaderGetOptions(reader, &options) == FTAIL_STATUS_OK);
    REQUIRE(options.waitForFile);
    REQUIRE(options.waitForFileTimeoutNs == 30'000'000'000LL);
    REQUIRE(options.closeOnDelete);
    REQUIRE_FALSE(options.closeOnTruncate);
    REQUIRE(options.idleTimeoutNs == 60'000'000'000LL);
    REQUIRE_FALSE(options.treatTimeoutsAsEOF);

    REQUIRE(::ftailReleaseReader(reader) == FTAIL_STATUS_OK);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Read a file until end of stream", "[api]")
{
    auto const path = directory / "capture.bin";
    ftail::tests::writeFile(path, "Hello, World!");

    auto reader = ::ftailReader{nullptr};
    REQUIRE(::ftailCreateReader(path.c_str(), R"({"closeOnDelete": true, "idleTimeoutMs": 100, "timeoutsAsEOF": true})", &reader) ==
            FTAIL_STATUS_OK);

    auto size = std::int64_t{0};
    REQUIRE(::ftailReaderWaitForFile(reader, &size) == FTAIL_STATUS_OK);
    REQUIRE(size == 13);

    std::uint8_t buffer[5];
    auto received = std::string{};
    auto status = FTAIL_STATUS_OK;
    while (status == FTAIL_STATUS_OK)
    {
        auto bytesRead = std::size_t{0};
        status = ::ftailReaderRead(reader, buffer, sizeof buffer, &bytesRead);
        received.append(reinterpret_cast<char const*>(buffer), bytesRead);
    }

    REQUIRE(status == FTAIL_END_OF_STREAM);
    REQUIRE(received == "Hello, World!");

    auto offset = std::int64_t{0};
    REQUIRE(::ftailReaderGetOffset(reader, &offset) == FTAIL_STATUS_OK);
    REQUIRE(offset == 13);

    REQUIRE(::ftailReleaseReader(reader) == FTAIL_STATUS_OK);
}

TEST_CASE_PERSISTENT_FIXTURE(ftail::tests::TempDirFixture, "Cancel before a wait", "[api]")
{
    auto const path = (directory / "never.bin").string();

    auto reader = ::ftailReader{nullptr};
    REQUIRE(::ftailCreateReader(path.c_str(), "", &reader) == FTAIL_STATUS_OK);
    REQUIRE(::ftailReaderCancel(reader) == FTAIL_STATUS_OK);
    REQUIRE(::ftailReaderWaitForFile(reader, nullptr) == FTAIL_ERR_CANCELLED);
    REQUIRE(::ftailReleaseReader(reader) == FTAIL_STATUS_OK);
}
