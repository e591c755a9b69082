#pragma once
#include "../../Compositing/Public/MaskBounds.hpp"
#include "TextureData.hpp"

#include <memory>

/// Decoded 2D mockup art for one device.
struct DeviceAssets
{
    std::shared_ptr<const TextureData> background{};
    std::shared_ptr<const TextureData> mask{};
    /// Visible screen region of the mask.
    MaskBounds maskBounds{};
};
