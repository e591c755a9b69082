#include "../Public/AssetCache.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../../Compositing/Public/MaskBounds.hpp"

#include <fmt/core.h>

#include <exception>
#include <string>

namespace
{
PendingAssets resolved(DeviceAssetsPtr assets)
{
    std::promise<DeviceAssetsPtr> promise;
    promise.set_value(std::move(assets));
    return promise.get_future().share();
}

DeviceAssetsPtr fetch_assets(const ImageSource& source, const std::string& deviceName,
                             const std::filesystem::path& backgroundPath, const std::filesystem::path& maskPath)
{
    auto background = source(backgroundPath);
    if (!background)
    {
        fmt::print(stderr, "AssetCache: failed to load 2D assets for {}: {}\n", deviceName,
                   background.error().message);
        return nullptr;
    }

    auto mask = source(maskPath);
    if (!mask)
    {
        fmt::print(stderr, "AssetCache: failed to load 2D assets for {}: {}\n", deviceName, mask.error().message);
        return nullptr;
    }

    auto assets = std::make_shared<DeviceAssets>();
    assets->maskBounds = extract_mask_bounds(*mask.value());
    assets->background = std::move(background.value());
    assets->mask = std::move(mask.value());

    fmt::print("Loaded 2D assets for {}: background {}x{}, screen {}x{} at ({}, {})\n", deviceName,
               assets->background->width, assets->background->height, assets->maskBounds.width,
               assets->maskBounds.height, assets->maskBounds.x, assets->maskBounds.y);
    return assets;
}
} // namespace

AssetCache::AssetCache(ImageSource source) : m_source(std::move(source))
{}

AssetCache::~AssetCache()
{
    if (m_executor)
        m_executor->wait_for_all();
}

entt::id_type AssetCache::slot_for(std::string_view deviceId) const
{
    entt::id_type id = entt::hashed_string{deviceId.data(), deviceId.size()};
    while (m_requests.contains(id) && m_requests[id]->deviceId != deviceId)
        ++id;
    return id;
}

PendingAssets AssetCache::load_assets(const DeviceDescriptor& device)
{
    const auto id = slot_for(device.id);
    if (m_requests.contains(id))
        return m_requests[id]->assets;

    if (!device.has2DAssets)
    {
        auto [it, inserted] = m_requests.load(id, device.id, resolved(nullptr));
        return it->second->assets;
    }

    auto promise = std::make_shared<std::promise<DeviceAssetsPtr>>();
    PendingAssets pending = promise->get_future().share();
    m_requests.load(id, device.id, pending);
    ++m_fetchCount;

    get_executor().silent_async([promise, source = m_source, name = device.name, backgroundPath = background_path(device),
                                 maskPath = mask_path(device)]() {
        DeviceAssetsPtr assets;
        try
        {
            assets = fetch_assets(source, name, backgroundPath, maskPath);
        }
        catch (const std::exception& e)
        {
            fmt::print(stderr, "AssetCache: failed to load 2D assets for {}: {}\n", name, e.what());
        }
        promise->set_value(std::move(assets));
    });

    return pending;
}

bool AssetCache::contains(std::string_view deviceId) const
{
    return m_requests.contains(slot_for(deviceId));
}

size_t AssetCache::size() const noexcept
{
    return m_requests.size();
}

void AssetCache::clear() noexcept
{
    m_requests.clear();
}
