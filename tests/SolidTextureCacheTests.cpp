#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Materials/Public/SolidTextureCache.hpp>

TEST_CASE("Each color is rendered and uploaded once")
{
    FakeViewer viewer;
    SolidTextureCache cache;
    const Color grey{0.5f, 0.5f, 0.5f, 1.0f};

    const auto first = cache.get_or_create(viewer, grey);
    const auto second = cache.get_or_create(viewer, grey);

    REQUIRE(first.has_value());
    REQUIRE(second == first);
    REQUIRE(viewer.created.size() == 1);
    REQUIRE(viewer.created[0].width == 1);
    REQUIRE(viewer.created[0].height == 1);
    REQUIRE(pixel_is(viewer.created[0], 0, 0, 128, 128, 128, 255));
    REQUIRE(cache.contains(grey));
    REQUIRE(cache.size() == 1);
}

TEST_CASE("Distinct colors get distinct textures")
{
    FakeViewer viewer;
    SolidTextureCache cache;

    const auto red = cache.get_or_create(viewer, Color{1.0f, 0.0f, 0.0f});
    const auto translucent = cache.get_or_create(viewer, Color{1.0f, 0.0f, 0.0f, 0.5f});

    REQUIRE(red.has_value());
    REQUIRE(translucent.has_value());
    REQUIRE_FALSE(*red == *translucent);
    REQUIRE(cache.size() == 2);
    REQUIRE(pixel_is(viewer.created[1], 0, 0, 255, 0, 0, 128));
}

TEST_CASE("Viewers without texture creation get nothing and nothing is cached")
{
    FakeViewer viewer;
    viewer.textureCreation = false;
    SolidTextureCache cache;
    const Color white{1.0f, 1.0f, 1.0f};

    REQUIRE_FALSE(cache.get_or_create(viewer, white).has_value());
    REQUIRE_FALSE(cache.contains(white));
    REQUIRE(cache.size() == 0);

    viewer.textureCreation = true;
    REQUIRE(cache.get_or_create(viewer, white).has_value());
    REQUIRE(cache.size() == 1);

    cache.clear();
    REQUIRE_FALSE(cache.contains(white));
}

TEST_CASE("Colors whose keys share a hash get their own textures")
{
    FakeViewer viewer;
    SolidTextureCache cache;
    const Color teal{0.0f, 0.6875f, 0.265625f, 1.0f};
    const Color lime{0.375f, 0.921875f, 0.3125f, 1.0f};

    const auto first = cache.get_or_create(viewer, teal);
    REQUIRE_FALSE(cache.contains(lime));

    const auto second = cache.get_or_create(viewer, lime);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE_FALSE(*first == *second);
    REQUIRE(viewer.created.size() == 2);
    REQUIRE(cache.size() == 2);

    REQUIRE(cache.get_or_create(viewer, teal) == first);
    REQUIRE(cache.get_or_create(viewer, lime) == second);
    REQUIRE(viewer.created.size() == 2);
}
