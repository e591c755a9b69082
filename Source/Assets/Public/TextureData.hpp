#pragma once
#include "../../Core/Public/Core.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

MKS_SUPPRESS_DLL_WARNINGS

/// CPU-side RGBA8 raster with straight (non-premultiplied) alpha.
/// Used for decoded device assets, user images, compositing surfaces and texture atlases.
struct MKS_EXPORT TextureData
{
    static constexpr std::uint32_t kChannels{4};

    /// Human-readable texture identifier.
    std::string name{};
    /// Source asset path for this texture payload (empty for generated rasters).
    std::filesystem::path sourcePath{};

    std::uint32_t width{};
    std::uint32_t height{};
    std::uint32_t channels{kChannels};

    std::vector<uint8_t> pixels{};

    /// Creates a fully transparent raster of the given size.
    static TextureData create(std::string name, std::uint32_t width, std::uint32_t height)
    {
        TextureData texture;
        texture.name = std::move(name);
        texture.width = width;
        texture.height = height;
        texture.pixels.assign(static_cast<size_t>(width) * height * kChannels, 0);
        return texture;
    }

    bool empty() const noexcept
    {
        return width == 0 || height == 0 || pixels.size() < static_cast<size_t>(width) * height * kChannels;
    }

    uint8_t* pixel(std::uint32_t x, std::uint32_t y) noexcept
    {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * kChannels;
    }
    const uint8_t* pixel(std::uint32_t x, std::uint32_t y) const noexcept
    {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * kChannels;
    }
};

MKS_RESTORE_DLL_WARNINGS
