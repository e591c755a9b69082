#include "../Public/FlatCompositor.hpp"
#include "../../Assets/Public/DeviceAssets.hpp"
#include "../Public/Canvas.hpp"
#include "../Public/CoverFit.hpp"

void FlatCompositor::render(TextureData& surface, const DeviceAssets* assets, const TextureData* userImage,
                            float chromeOffset) noexcept
{
    Canvas canvas(surface);
    canvas.clear();

    if (!assets || !assets->background)
        return;

    const TextureData& background = *assets->background;
    canvas.draw_image(background, 0.0f, 0.0f);

    if (!userImage || userImage->empty() || !assets->mask)
        return;

    TextureData layer = TextureData::create("screen-layer", background.width, background.height);
    Canvas layerCanvas(layer);
    layerCanvas.draw_image(*assets->mask, 0.0f, 0.0f);
    layerCanvas.set_composite_operation(CompositeOperation::SourceIn);

    const MaskBounds& bounds = assets->maskBounds;
    const CoverFit fit =
        compute_cover_fit(static_cast<float>(userImage->width), static_cast<float>(userImage->height),
                          static_cast<float>(bounds.width), static_cast<float>(bounds.height));

    layerCanvas.draw_image(*userImage, static_cast<float>(bounds.x) + fit.offsetX,
                           static_cast<float>(bounds.y) + fit.offsetY + chromeOffset, fit.drawWidth, fit.drawHeight);

    canvas.set_composite_operation(CompositeOperation::SourceOver);
    canvas.draw_image(layer, 0.0f, 0.0f);
}

TextureData FlatCompositor::make_surface(const DeviceAssets* assets)
{
    if (!assets || !assets->background)
        return {};
    return TextureData::create("mockup", assets->background->width, assets->background->height);
}
