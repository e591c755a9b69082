#pragma once

#include <algorithm>

/// Placement of a source image scaled to cover a target rectangle.
/// Offsets are relative to the rectangle origin and are never positive.
struct CoverFit
{
    float drawWidth{};
    float drawHeight{};
    float offsetX{};
    float offsetY{};
};

/// Scales the source up (or down) until it fully covers the target, preserving aspect ratio,
/// and centers it so the overflow is cropped symmetrically.
/// A source with a non-positive dimension yields an empty fit.
constexpr CoverFit compute_cover_fit(float sourceWidth, float sourceHeight, float targetWidth,
                                     float targetHeight) noexcept
{
    if (sourceWidth <= 0.0f || sourceHeight <= 0.0f)
        return {};

    const float scale = std::max(targetWidth / sourceWidth, targetHeight / sourceHeight);

    CoverFit fit;
    fit.drawWidth = sourceWidth * scale;
    fit.drawHeight = sourceHeight * scale;
    fit.offsetX = (targetWidth - fit.drawWidth) / 2.0f;
    fit.offsetY = (targetHeight - fit.drawHeight) / 2.0f;
    return fit;
}
