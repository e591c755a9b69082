#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Assets/Public/DeviceAssets.hpp>
#include <Compositing/Public/FlatCompositor.hpp>

#include <memory>

namespace
{
DeviceAssets make_assets()
{
    DeviceAssets assets;
    assets.background = std::make_shared<TextureData>(make_solid(128, 256, 0, 0, 255));

    auto mask = std::make_shared<TextureData>(TextureData::create("mask", 128, 256));
    for (std::uint32_t y = 20; y < 220; ++y)
        for (std::uint32_t x = 10; x < 110; ++x)
            mask->pixel(x, y)[3] = 255;
    assets.mask = mask;
    assets.maskBounds = MaskBounds{10, 20, 100, 200};
    return assets;
}
} // namespace

TEST_CASE("Null assets leave the surface blank")
{
    TextureData surface = make_solid(4, 4, 9, 9, 9);
    const TextureData image = make_solid(2, 2, 255, 0, 0);

    FlatCompositor::render(surface, nullptr, &image, 0.0f);

    REQUIRE(pixel_is(surface, 0, 0, 0, 0, 0, 0));
    REQUIRE(pixel_is(surface, 3, 3, 0, 0, 0, 0));
}

TEST_CASE("Without a user image only the background is drawn")
{
    const DeviceAssets assets = make_assets();
    TextureData surface = FlatCompositor::make_surface(&assets);
    REQUIRE(surface.width == 128);
    REQUIRE(surface.height == 256);

    FlatCompositor::render(surface, &assets, nullptr, 5.0f);

    REQUIRE(pixel_is(surface, 50, 100, 0, 0, 255));
}

TEST_CASE("User image is cover-fitted into the mask bounds shifted by the chrome offset")
{
    // 50x100 into 100x200 scales by 2 and lands at (10, 25) with size 100x200.
    const DeviceAssets assets = make_assets();
    const TextureData image = make_solid(50, 100, 255, 0, 0);
    TextureData surface = FlatCompositor::make_surface(&assets);

    FlatCompositor::render(surface, &assets, &image, 5.0f);

    REQUIRE(pixel_is(surface, 10, 25, 255, 0, 0));
    REQUIRE(pixel_is(surface, 109, 219, 255, 0, 0));
    REQUIRE(pixel_is(surface, 60, 120, 255, 0, 0));

    // Inside the mask but above the shifted image.
    REQUIRE(pixel_is(surface, 50, 22, 0, 0, 255));
    // Covered by the image but outside the mask.
    REQUIRE(pixel_is(surface, 50, 222, 0, 0, 255));
    REQUIRE(pixel_is(surface, 9, 100, 0, 0, 255));
    REQUIRE(pixel_is(surface, 110, 100, 0, 0, 255));
}
