#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/TextureData.hpp"

#include <cstdint>

struct DeviceAssets;
struct DeviceDescriptor;

MKS_SUPPRESS_DLL_WARNINGS

/// Pixel size of the flat screen raster the user image is fitted into.
struct ScreenSize
{
    std::uint32_t width{};
    std::uint32_t height{};

    constexpr bool operator==(const ScreenSize&) const noexcept = default;
};

/// Placement of the screen raster inside the square texture atlas.
struct ScreenTextureLayout
{
    std::uint32_t atlasSize{};

    // UV rectangle in atlas pixels (top-left origin, V flipped).
    float rectLeft{};
    float rectTop{};
    float rectWidth{};
    float rectHeight{};

    /// Rectangle center plus the absolute and percent translation.
    float originX{};
    float originY{};
    float rotation{};
    /// Base rect/screen ratio times the extra device scale.
    float scaleX{1.0f};
    float scaleY{1.0f};
    /// True for odd multiples of 90 degrees, where screen width and height trade places.
    bool swapsAxes{false};
};

/// Paints a user image into the screen region of a device model's texture atlas.
///
/// The image is first cover-fitted into a screen-sized raster, which is then drawn centered
/// at the UV rectangle with translate -> rotate -> scale applied in that order.
class MKS_EXPORT ScreenTexturePainter
{
  public:
    /// Screen raster size: mask bounds when 2D assets exist, otherwise the nominal screen size.
    static Result<ScreenSize> screen_dimensions(const DeviceDescriptor& device, const DeviceAssets* assets);

    static ScreenTextureLayout compute_layout(const DeviceDescriptor& device, ScreenSize screen) noexcept;

    /// Renders the screen raster for the user image (cover-fit plus screenTextureOffset).
    static TextureData render_screen(const TextureData& userImage, const DeviceDescriptor& device, ScreenSize screen);

    /// Returns the opaque-black atlas with the user image painted into the UV rectangle.
    Result<TextureData> paint(const TextureData& userImage, const DeviceDescriptor& device,
                              const DeviceAssets* assets) const;
};

MKS_RESTORE_DLL_WARNINGS
