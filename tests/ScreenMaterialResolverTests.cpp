#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Materials/Public/ScreenMaterialBindings.hpp>
#include <Materials/Public/ScreenMaterialResolver.hpp>

#include <vector>

namespace
{
DeviceDescriptor make_device(std::string screenMaterial = {})
{
    DeviceDescriptor device;
    device.id = "device";
    device.name = "Device";
    device.screenMaterialName = std::move(screenMaterial);
    return device;
}
} // namespace

TEST_CASE("Name scoring favours screen backgrounds and penalises glass")
{
    REQUIRE(ScreenMaterialResolver::score("ScreenBG") == 8);
    REQUIRE(ScreenMaterialResolver::score("screen") == 6);
    REQUIRE(ScreenMaterialResolver::score("DISPLAY") == 4);
    REQUIRE(ScreenMaterialResolver::score("Glass") == -3);
    REQUIRE(ScreenMaterialResolver::score("Panel") == 2);
    REQUIRE(ScreenMaterialResolver::score("Screen_Glass_Panel") == 6 - 3 + 2);
    REQUIRE(ScreenMaterialResolver::score("Body") == 0);
}

TEST_CASE("Highest scoring material wins and is bound")
{
    FakeMaterial glass("Glass");
    FakeMaterial screen("ScreenBG");
    FakeMaterial panel("Panel");
    const std::vector<IMaterialSurface*> materials{&glass, &screen, &panel};

    ScreenMaterialBindings bindings;
    ScreenMaterialResolver resolver(bindings);
    const DeviceDescriptor device = make_device();

    REQUIRE(resolver.resolve(device, materials) == &screen);
    REQUIRE(bindings.find("device") != nullptr);
    REQUIRE(*bindings.find("device") == "ScreenBG");
}

TEST_CASE("Ties resolve to the first material")
{
    FakeMaterial first("Screen");
    FakeMaterial second("Screen");
    const std::vector<IMaterialSurface*> materials{&first, &second};

    ScreenMaterialBindings bindings;
    ScreenMaterialResolver resolver(bindings);
    REQUIRE(resolver.resolve(make_device(), materials) == &first);

    FakeMaterial body("Body");
    FakeMaterial trim("Trim");
    const std::vector<IMaterialSurface*> unscored{&body, &trim};
    ScreenMaterialBindings otherBindings;
    ScreenMaterialResolver otherResolver(otherBindings);
    DeviceDescriptor other = make_device();
    other.id = "other";
    REQUIRE(otherResolver.resolve(other, unscored) == &body);
}

TEST_CASE("A bound name that still exists wins over the heuristic")
{
    FakeMaterial screen("Screen");
    FakeMaterial custom("sfCQkHOWyrsLmor");
    const std::vector<IMaterialSurface*> materials{&screen, &custom};

    ScreenMaterialBindings bindings;
    ScreenMaterialResolver resolver(bindings);

    REQUIRE(resolver.resolve(make_device("sfCQkHOWyrsLmor"), materials) == &custom);
    REQUIRE(*bindings.find("device") == "sfCQkHOWyrsLmor");
}

TEST_CASE("A stale binding falls back to scoring and is replaced")
{
    FakeMaterial body("Body");
    FakeMaterial display("Display");
    const std::vector<IMaterialSurface*> materials{&body, &display};

    ScreenMaterialBindings bindings;
    bindings.bind("device", "RemovedMaterial");
    ScreenMaterialResolver resolver(bindings);

    REQUIRE(resolver.resolve(make_device(), materials) == &display);
    REQUIRE(*bindings.find("device") == "Display");
}

TEST_CASE("Seeding never overrides a discovered binding")
{
    ScreenMaterialBindings bindings;
    bindings.bind("device", "Discovered");
    bindings.seed(make_device("Configured"));
    REQUIRE(*bindings.find("device") == "Discovered");

    ScreenMaterialBindings fresh;
    fresh.seed(make_device());
    REQUIRE(fresh.size() == 0);
    fresh.seed(make_device("Configured"));
    REQUIRE(*fresh.find("device") == "Configured");
}

TEST_CASE("Empty material lists resolve to nothing")
{
    ScreenMaterialBindings bindings;
    ScreenMaterialResolver resolver(bindings);

    REQUIRE(resolver.resolve(make_device(), {}) == nullptr);
    REQUIRE(bindings.size() == 0);
}
