#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Assets/Public/AssetCache.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{
/// Serves a 32x48 background and a mask whose opaque block is (4, 6, 10, 12).
struct FakeArt
{
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

    ImageSource source() const
    {
        return [calls = calls](const std::filesystem::path& path) -> Result<std::shared_ptr<TextureData>> {
            ++*calls;
            const std::string file = path.filename().string();
            if (file.starts_with("broken"))
                return make_error("decode failed", ErrorCode::AssetParsingFailed);

            if (file.find("screenmask") == std::string::npos)
                return std::make_shared<TextureData>(make_solid(32, 48, 0, 0, 255));

            auto mask = std::make_shared<TextureData>(TextureData::create("mask", 32, 48));
            for (std::uint32_t y = 6; y < 18; ++y)
                for (std::uint32_t x = 4; x < 14; ++x)
                    mask->pixel(x, y)[3] = 255;
            return mask;
        };
    }
};

DeviceDescriptor make_device(std::string id, bool has2D = true)
{
    DeviceDescriptor device;
    device.id = id;
    device.name = id;
    device.folder = "art";
    device.assetPrefix = std::move(id);
    device.has2DAssets = has2D;
    return device;
}
} // namespace

TEST_CASE("Concurrent requests share one fetch")
{
    FakeArt art;
    AssetCache cache(art.source());
    const DeviceDescriptor device = make_device("phone");

    PendingAssets first = cache.load_assets(device);
    PendingAssets second = cache.load_assets(device);

    const DeviceAssetsPtr assets = first.get();
    REQUIRE(assets != nullptr);
    REQUIRE(second.get() == assets);
    REQUIRE(cache.fetch_count() == 1);
    REQUIRE(art.calls->load() == 2);
    REQUIRE(cache.contains("phone"));
    REQUIRE(cache.size() == 1);

    REQUIRE(assets->background->width == 32);
    REQUIRE(assets->maskBounds == MaskBounds{4, 6, 10, 12});

    // Finished loads are served from the cache as well.
    REQUIRE(cache.load_assets(device).get() == assets);
    REQUIRE(art.calls->load() == 2);
}

TEST_CASE("Devices without 2D art resolve to null immediately")
{
    FakeArt art;
    AssetCache cache(art.source());

    PendingAssets pending = cache.load_assets(make_device("laptop", false));

    REQUIRE(pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    REQUIRE(pending.get() == nullptr);
    REQUIRE(cache.fetch_count() == 0);
    REQUIRE(art.calls->load() == 0);
}

TEST_CASE("Failed loads are cached as null until cleared")
{
    FakeArt art;
    AssetCache cache(art.source());
    const DeviceDescriptor device = make_device("broken");

    REQUIRE(cache.load_assets(device).get() == nullptr);
    REQUIRE(cache.load_assets(device).get() == nullptr);
    REQUIRE(cache.fetch_count() == 1);
    REQUIRE(art.calls->load() == 1);

    cache.clear();
    REQUIRE_FALSE(cache.contains("broken"));
    REQUIRE(cache.load_assets(device).get() == nullptr);
    REQUIRE(cache.fetch_count() == 2);
}

TEST_CASE("Distinct devices are fetched independently")
{
    FakeArt art;
    AssetCache cache(art.source());

    auto phone = cache.load_assets(make_device("phone"));
    auto tablet = cache.load_assets(make_device("tablet"));

    REQUIRE(phone.get() != tablet.get());
    REQUIRE(cache.fetch_count() == 2);
    REQUIRE(cache.size() == 2);
}

TEST_CASE("An image source that throws resolves the load to null")
{
    std::atomic<int> calls{0};
    AssetCache cache([&calls](const std::filesystem::path&) -> Result<std::shared_ptr<TextureData>> {
        ++calls;
        throw std::runtime_error("decoder crashed");
    });
    const DeviceDescriptor device = make_device("phone");

    PendingAssets pending = cache.load_assets(device);
    DeviceAssetsPtr assets;
    REQUIRE_NOTHROW(assets = pending.get());
    REQUIRE(assets == nullptr);
    REQUIRE(cache.contains("phone"));

    REQUIRE(cache.load_assets(device).get() == nullptr);
    REQUIRE(cache.fetch_count() == 1);
    REQUIRE(calls.load() == 1);
}

TEST_CASE("Device ids with the same hash are cached separately")
{
    FakeArt art;
    AssetCache cache(art.source());
    const DeviceDescriptor first = make_device("device-481839");
    const DeviceDescriptor second = make_device("device-1273006", false);

    const DeviceAssetsPtr firstAssets = cache.load_assets(first).get();
    REQUIRE(firstAssets != nullptr);

    // The second device has no 2D art, so sharing the first entry would hand back its assets.
    REQUIRE(cache.load_assets(second).get() == nullptr);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.contains("device-481839"));
    REQUIRE(cache.contains("device-1273006"));
    REQUIRE(cache.load_assets(first).get() == firstAssets);
    REQUIRE(cache.fetch_count() == 1);
}
