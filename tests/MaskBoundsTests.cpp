#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Compositing/Public/MaskBounds.hpp>

TEST_CASE("Fully transparent mask yields its full extent")
{
    const TextureData mask = TextureData::create("mask", 12, 7);

    REQUIRE(extract_mask_bounds(mask) == MaskBounds{0, 0, 12, 7});
}

TEST_CASE("Single opaque pixel yields a one-pixel box")
{
    TextureData mask = TextureData::create("mask", 10, 8);
    mask.pixel(3, 5)[3] = 255;

    REQUIRE(extract_mask_bounds(mask) == MaskBounds{3, 5, 1, 1});
}

TEST_CASE("Mask bounds are inclusive and ignore color channels")
{
    TextureData mask = TextureData::create("mask", 32, 32);
    mask.pixel(4, 6)[3] = 1;
    mask.pixel(20, 25)[3] = 128;
    // Color without alpha does not count.
    mask.pixel(30, 30)[0] = 255;

    REQUIRE(extract_mask_bounds(mask) == MaskBounds{4, 6, 17, 20});
}

TEST_CASE("Opaque mask covers everything")
{
    const TextureData mask = make_solid(5, 9, 0, 0, 0);

    REQUIRE(extract_mask_bounds(mask) == MaskBounds{0, 0, 5, 9});
}
