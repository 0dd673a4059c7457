// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <ftail/ftail.h>

namespace ftail::lib
{
    class TailingReader;
}

namespace ftail::tests
{
    //
    // RAII helper to create a fresh, empty directory for the duration of a test
    //
    class TempDirFixture
    {
    public:
        /// Create a unique directory below the system temporary directory.
        TempDirFixture();
        /// Remove the directory and everything in it.
        ~TempDirFixture();

    protected:
        /// The path to the directory
        std::filesystem::path directory;
    };

    //
    // A writer that keeps its file descriptor (and thus its file position)
    // open across writes, like a producer process appending to a capture.
    //
    class FileWriter
    {
    public:
        /// Create (or truncate) the file.
        explicit FileWriter(std::filesystem::path const& path);
        ~FileWriter();

        FileWriter(FileWriter const&) = delete;
        FileWriter& operator=(FileWriter const&) = delete;

        /// Write at the current position.
        void write(std::string_view data);

        /// ftruncate() the file, leaving the current position untouched.
        void truncate(std::int64_t size);

    private:
        int _fd;
    };

    // Simple utility to read a file into a string
    std::string readFile(std::filesystem::path const& filepath);

    // Replace the content of a file
    void writeFile(std::filesystem::path const& filepath, std::string_view content);

    // Append to a file, creating it if needed
    void appendFile(std::filesystem::path const& filepath, std::string_view content);

    // Read once from the reader into a buffer of the given capacity.
    // Returns the bytes read and stores the status.
    std::string readOnce(ftail::lib::TailingReader& reader, std::size_t capacity, ftailStatus& out_status);

} // namespace ftail::tests
