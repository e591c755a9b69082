#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../Private/TextureLoader.hpp"
#include "DeviceAssets.hpp"
#include "TextureData.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <entt/core/hashed_string.hpp>
#include <entt/resource/cache.hpp>
#include <entt/resource/resource.hpp>
#include <taskflow/taskflow.hpp>

struct DeviceDescriptor;

MKS_SUPPRESS_DLL_WARNINGS

/// Shared handle to a device's 2D assets; null when the device has none or loading failed.
using DeviceAssetsPtr = std::shared_ptr<const DeviceAssets>;
/// Result of a (possibly still running) asset load. Every requester of the same device
/// observes the same shared state.
using PendingAssets = std::shared_future<DeviceAssetsPtr>;

/// Decodes one image file into an RGBA8 raster. Replaceable for tests.
using ImageSource = std::function<Result<std::shared_ptr<TextureData>>(const std::filesystem::path&)>;

/// Per-device cache of background/mask art.
///
/// Uses entt::resource_cache keyed by the hashed device id (colliding ids take the next free id):
///   - First request for a device starts a single background load on the Taskflow executor
///   - Later requests (in flight or finished) return the same shared future
///   - Failed loads are logged and cached as null; there is no retry until clear()
///
/// All cache mutation happens on the calling thread; only decoding runs on workers.
class MKS_EXPORT AssetCache
{
  public:
    explicit AssetCache(ImageSource source = &TextureLoader::load_image);
    /// Waits for in-flight loads before releasing the executor.
    ~AssetCache();

    // Non-copyable, non-movable (owns executor + cache)
    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    /// Returns the pending or finished assets for the device, starting the load on first use.
    /// Devices without 2D art resolve immediately to null.
    PendingAssets load_assets(const DeviceDescriptor& device);

    /// Returns true if a request for this device id has been cached.
    bool contains(std::string_view deviceId) const;

    /// Number of cached device entries.
    size_t size() const noexcept;

    /// Drops every cached entry. Loads already running still complete for their requesters.
    void clear() noexcept;

    /// Number of image-pair fetches actually started.
    size_t fetch_count() const noexcept
    {
        return m_fetchCount.load();
    }

    /// Returns a reference to the Taskflow executor for scheduling async work.
    tf::Executor& get_executor() noexcept
    {
        if (!m_executor)
        {
            const std::uint32_t workers = std::max(1u, std::thread::hardware_concurrency());
            m_executor = std::make_unique<tf::Executor>(workers);
        }
        return *m_executor;
    }

  private:
    struct AssetRequest
    {
        AssetRequest(std::string id, PendingAssets pending) : deviceId{std::move(id)}, assets{std::move(pending)}
        {}

        std::string deviceId;
        PendingAssets assets;
    };

    /// Id holding this device, or the free id it would be stored under.
    entt::id_type slot_for(std::string_view deviceId) const;

    entt::resource_cache<AssetRequest> m_requests;
    ImageSource m_source;
    std::atomic<size_t> m_fetchCount{0};

    std::unique_ptr<tf::Executor> m_executor;
};

MKS_RESTORE_DLL_WARNINGS
