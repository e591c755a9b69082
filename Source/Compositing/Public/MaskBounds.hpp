#pragma once
#include "../../Core/Public/Core.hpp"

#include <cstdint>

struct TextureData;

/// Bounding rectangle of the visible screen region, in mask pixel space.
struct MaskBounds
{
    std::uint32_t x{};
    std::uint32_t y{};
    std::uint32_t width{};
    std::uint32_t height{};

    constexpr bool operator==(const MaskBounds&) const noexcept = default;
};

/// Returns the inclusive bounding box of all pixels with alpha > 0.
/// A fully transparent mask yields the full mask extent so downstream fits never target a
/// zero-area rectangle.
MKS_EXPORT MaskBounds extract_mask_bounds(const TextureData& mask) noexcept;
