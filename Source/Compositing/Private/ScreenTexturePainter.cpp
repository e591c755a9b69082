#include "../Public/ScreenTexturePainter.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/DeviceAssets.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../Public/Canvas.hpp"
#include "../Public/CoverFit.hpp"

#include <cmath>
#include <numbers>

#include <fmt/core.h>

namespace
{
/// Zero means "not configured" for the extra scale factors.
float scale_or_identity(float value) noexcept
{
    return value != 0.0f ? value : 1.0f;
}
} // namespace

Result<ScreenSize> ScreenTexturePainter::screen_dimensions(const DeviceDescriptor& device, const DeviceAssets* assets)
{
    if (assets)
    {
        const MaskBounds& bounds = assets->maskBounds;
        if (bounds.width == 0 || bounds.height == 0)
            return make_error(fmt::format("Empty screen mask for device: {}", device.name),
                              ErrorCode::NoScreenDimensions);
        return ScreenSize{bounds.width, bounds.height};
    }

    if (device.screenWidth > 0 && device.screenHeight > 0)
        return ScreenSize{device.screenWidth, device.screenHeight};

    return make_error(fmt::format("No screen dimensions available for device: {}", device.name),
                      ErrorCode::NoScreenDimensions);
}

ScreenTextureLayout ScreenTexturePainter::compute_layout(const DeviceDescriptor& device, ScreenSize screen) noexcept
{
    ScreenTextureLayout layout;
    layout.atlasSize = device.screenTextureSize > 0 ? device.screenTextureSize : screen.width;

    const UvRect uv = device.screenTextureUV.value_or(UvRect{});
    const float atlas = static_cast<float>(layout.atlasSize);
    layout.rectLeft = uv.uMin * atlas;
    layout.rectTop = (1.0f - uv.vMax) * atlas;
    layout.rectWidth = uv.uMax * atlas - layout.rectLeft;
    layout.rectHeight = (1.0f - uv.vMin) * atlas - layout.rectTop;

    const float translateX = device.screenTextureTranslateX + layout.rectWidth * device.screenTextureTranslatePercentX;
    const float translateY = device.screenTextureTranslateY + layout.rectHeight * device.screenTextureTranslatePercentY;
    layout.originX = layout.rectLeft + layout.rectWidth / 2.0f + translateX;
    layout.originY = layout.rectTop + layout.rectHeight / 2.0f + translateY;

    layout.rotation = device.screenTextureRotation;
    const double quarterTurns = std::round(static_cast<double>(layout.rotation) / (std::numbers::pi / 2.0));
    layout.swapsAxes = static_cast<long long>(std::abs(quarterTurns)) % 2 == 1;

    const float widthForScale = static_cast<float>(layout.swapsAxes ? screen.height : screen.width);
    const float heightForScale = static_cast<float>(layout.swapsAxes ? screen.width : screen.height);
    layout.scaleX = layout.rectWidth / widthForScale * scale_or_identity(device.screenTextureScaleX);
    layout.scaleY = layout.rectHeight / heightForScale * scale_or_identity(device.screenTextureScaleY);
    return layout;
}

TextureData ScreenTexturePainter::render_screen(const TextureData& userImage, const DeviceDescriptor& device,
                                                ScreenSize screen)
{
    TextureData raster = TextureData::create("screen", screen.width, screen.height);
    const CoverFit fit = compute_cover_fit(static_cast<float>(userImage.width), static_cast<float>(userImage.height),
                                           static_cast<float>(screen.width), static_cast<float>(screen.height));

    Canvas canvas(raster);
    canvas.draw_image(userImage, fit.offsetX, fit.offsetY + device.screenTextureOffset, fit.drawWidth,
                      fit.drawHeight);
    return raster;
}

Result<TextureData> ScreenTexturePainter::paint(const TextureData& userImage, const DeviceDescriptor& device,
                                                const DeviceAssets* assets) const
{
    if (userImage.empty())
        return make_error(fmt::format("User image '{}' has no pixels", userImage.name), ErrorCode::InvalidRaster);

    auto screen = screen_dimensions(device, assets);
    if (!screen)
        return make_error(screen.error());

    const ScreenSize size = screen.value();
    const TextureData screenRaster = render_screen(userImage, device, size);
    const ScreenTextureLayout layout = compute_layout(device, size);

    TextureData atlas = TextureData::create(fmt::format("{}-screen-texture", device.id), layout.atlasSize,
                                            layout.atlasSize);
    Canvas canvas(atlas);
    canvas.fill(Color{0.0f, 0.0f, 0.0f, 1.0f});

    canvas.save();
    canvas.translate(layout.originX, layout.originY);
    if (layout.rotation != 0.0f)
        canvas.rotate(layout.rotation);
    if (layout.scaleX != 1.0f || layout.scaleY != 1.0f)
        canvas.scale(layout.scaleX, layout.scaleY);

    const float width = static_cast<float>(size.width);
    const float height = static_cast<float>(size.height);
    canvas.draw_image(screenRaster, -width / 2.0f, -height / 2.0f, width, height);
    canvas.restore();

    return atlas;
}
