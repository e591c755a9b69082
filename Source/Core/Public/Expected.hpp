#pragma once
#include "Core.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/core.h>

enum class ErrorCode
{
    None = 0,

    // Utils Errors
    FileReadFailed = 100,
    FileWriteFailed,

    // Asset Errors
    AssetFileNotFound = 200,
    AssetParsingFailed,
    AssetInvalidData,
    AssetCacheReadFailed,
    AssetCacheWriteFailed,

    // Compositing Errors
    NoScreenDimensions = 300,
    InvalidRaster,

    // Material Errors
    MaterialNotFound = 400,
    MutationUnsupported,
    TextureApplicationExhausted,
    TextureCreationUnavailable,

    // Catalog Errors
    DeviceNotFound = 500,
    CatalogInvalid,

    // Viewer Errors
    ModelNotLoaded = 600,
    ViewModeUnavailable,
};

struct Error
{
    std::string message{};
    ErrorCode code{ErrorCode::None};
};

template <typename T = void> using Result = std::expected<T, Error>;

inline static auto make_error(std::string_view message, ErrorCode code = ErrorCode::None)
{
    return std::unexpected(Error{std::string(message), code});
}

inline static auto make_error(const Error& error)
{
    return std::unexpected(error);
}

inline static std::uint32_t get_error_code(const Result<>& result) noexcept
{
    if (result)
        return static_cast<std::uint32_t>(ErrorCode::None);
    const auto& err = result.error();
    const std::uint32_t code = static_cast<std::uint32_t>(err.code);
    fmt::print("ERROR ({}): {}\n", code, err.message);
    return code;
}
