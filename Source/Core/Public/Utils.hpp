#pragma once

#include "Expected.hpp"

#include <fstream>
#include <filesystem>
#include <system_error>
#include <vector>

static inline Result<std::vector<char>> read_file(const std::filesystem::path& filePath)
{
    std::error_code ec;
    if (std::filesystem::is_directory(filePath, ec))
    {
        return make_error("Path is a directory: " + filePath.string(), ErrorCode::FileReadFailed);
    }

    std::ifstream file{filePath, std::ios::ate | std::ios::binary};

    if (!file.is_open())
    {
        return make_error("Failed to open file: " + filePath.string(), ErrorCode::FileReadFailed);
    }

    const std::streamoff end = file.tellg();
    if (end < 0)
    {
        return make_error("Failed to size file: " + filePath.string(), ErrorCode::FileReadFailed);
    }

    const auto fileSize = static_cast<size_t>(end);
    std::vector<char> buffer(fileSize);

    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));
    if (static_cast<size_t>(file.gcount()) != fileSize)
    {
        return make_error("Failed to read file: " + filePath.string(), ErrorCode::FileReadFailed);
    }

    file.close();

    return buffer;
}

static inline Result<> write_file(const std::filesystem::path& filePath, const void* data, size_t size)
{
    std::ofstream file{filePath, std::ios::binary};
    if (!file.is_open())
    {
        return make_error("Failed to open file for writing: " + filePath.string(), ErrorCode::FileWriteFailed);
    }

    file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file.good())
    {
        return make_error("Failed to write file: " + filePath.string(), ErrorCode::FileWriteFailed);
    }

    return {};
}
