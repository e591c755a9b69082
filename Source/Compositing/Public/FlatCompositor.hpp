#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Assets/Public/TextureData.hpp"

struct DeviceAssets;

MKS_SUPPRESS_DLL_WARNINGS

/// Produces the flat 2D mockup: device background with the user image clipped to the screen mask.
class MKS_EXPORT FlatCompositor
{
  public:
    /// Clears the surface and redraws it.
    ///   - null assets: surface stays transparent
    ///   - no user image: background only
    ///   - otherwise the image is cover-fitted to the mask bounds (shifted down by chromeOffset),
    ///     clipped by the mask on an offscreen layer and painted over the background
    static void render(TextureData& surface, const DeviceAssets* assets, const TextureData* userImage,
                       float chromeOffset) noexcept;

    /// Returns a transparent surface sized to the device background (empty when assets are null).
    static TextureData make_surface(const DeviceAssets* assets);
};

MKS_RESTORE_DLL_WARNINGS
