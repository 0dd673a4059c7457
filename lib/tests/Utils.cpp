// SPDX-FileCopyrightText: 2025 Contributors to the ftail project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <fmt/format.h>
#include "ftail-internal/TailingReader.hpp"

namespace ftail::tests
{
    TempDirFixture::TempDirFixture()
    {
        auto pattern = (std::filesystem::temp_directory_path() / "ftail-tests-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr)
        {
            throw std::runtime_error{fmt::format("mkdtemp failed: {}", std::strerror(errno))};
        }
        directory = pattern;
    }

    TempDirFixture::~TempDirFixture()
    {
        auto ec = std::error_code{};
        std::filesystem::remove_all(directory, ec);
    }

    FileWriter::FileWriter(std::filesystem::path const& path)
        : _fd{::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)}
    {
        if (_fd == -1)
        {
            throw std::runtime_error{fmt::format("Could not create {}: {}", path.string(), std::strerror(errno))};
        }
    }

    FileWriter::~FileWriter()
    {
        ::close(_fd);
    }

    void FileWriter::write(std::string_view data)
    {
        while (!data.empty())
        {
            auto const n = ::write(_fd, data.data(), data.size());
            if (n == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw std::runtime_error{fmt::format("write failed: {}", std::strerror(errno))};
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    void FileWriter::truncate(std::int64_t size)
    {
        if (::ftruncate(_fd, size) != 0)
        {
            throw std::runtime_error{fmt::format("ftruncate failed: {}", std::strerror(errno))};
        }
    }

    std::string readFile(std::filesystem::path const& filepath)
    {
        auto file = std::ifstream{filepath, std::ios::in | std::ios::binary};
        if (!file)
        {
            throw std::runtime_error{"Failed to open file: " + filepath.string()};
        }
        return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    void writeFile(std::filesystem::path const& filepath, std::string_view content)
    {
        auto file = std::ofstream{filepath, std::ios::out | std::ios::binary | std::ios::trunc};
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file)
        {
            throw std::runtime_error{"Failed to write file: " + filepath.string()};
        }
    }

    void appendFile(std::filesystem::path const& filepath, std::string_view content)
    {
        auto file = std::ofstream{filepath, std::ios::out | std::ios::binary | std::ios::app};
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file)
        {
            throw std::runtime_error{"Failed to append to file: " + filepath.string()};
        }
    }

    std::string readOnce(ftail::lib::TailingReader& reader, std::size_t capacity, ftailStatus& out_status)
    {
        auto buffer = std::vector<std::uint8_t>(capacity);
        auto bytesRead = std::size_t{0};
        out_status = reader.read(buffer.data(), buffer.size(), bytesRead);
        return {reinterpret_cast<char const*>(buffer.data()), bytesRead};
    }
}
