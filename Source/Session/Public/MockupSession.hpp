#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/AssetCache.hpp"
#include "../../Assets/Public/TextureData.hpp"
#include "../../Catalog/Public/DeviceCatalog.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../../Materials/Public/BodyTint.hpp"
#include "../../Materials/Public/ScreenApplier.hpp"
#include "../../Materials/Public/ScreenMaterialBindings.hpp"
#include "../../Materials/Public/ScreenMaterialResolver.hpp"
#include "../../Materials/Public/SolidTextureCache.hpp"
#include "RequestFence.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class IModelViewer;

MKS_SUPPRESS_DLL_WARNINGS

enum class ViewMode : std::uint8_t
{
    Flat,
    Model,
};

constexpr std::string_view to_string(ViewMode mode) noexcept
{
    return mode == ViewMode::Flat ? "2d" : "3d";
}

/// State of one mockup editing session: active device, user image, view mode and the
/// caches that keep asset and texture work from repeating.
///
/// Everything runs on the caller's thread except asset decoding, whose results are picked
/// up by poll_assets(). A RequestFence drops results of superseded device selections.
class MKS_EXPORT MockupSession
{
  public:
    /// The viewer is optional; without one only the flat mode is usable.
    MockupSession(const DeviceCatalog& catalog, AssetCache& assetCache, IModelViewer* viewer = nullptr);

    MockupSession(const MockupSession&) = delete;
    MockupSession& operator=(const MockupSession&) = delete;

    // ── Device ─────────────────────────────────────────────────────────

    /// Activates a catalog device and starts loading its 2D assets.
    /// Picks the flat view when 2D assets exist, otherwise the model view when a model exists.
    Result<> select_device(std::string_view deviceId);

    /// Applies finished asset loads. Results of superseded selections are discarded.
    /// With wait set, blocks until the current selection's load is done.
    /// Returns true when assets for the active device were applied.
    bool poll_assets(bool wait);

    // ── Input ──────────────────────────────────────────────────────────

    /// Replaces the user image and marks the model texture dirty; reconfigures the model
    /// when the active device has one.
    void set_user_image(std::shared_ptr<const TextureData> image);

    Result<> set_view_mode(ViewMode mode);

    // ── Output ─────────────────────────────────────────────────────────

    /// Redraws the flat mockup into the surface.
    void render_flat(TextureData& surface) const noexcept;

    /// Renders the flat mockup into a new background-sized surface (empty without assets).
    TextureData render_flat() const;

    /// Brings the viewer in line with the active device: loads the model when the path changed,
    /// applies viewer settings, paints the screen when needed (or forced, or dirty), otherwise
    /// shows the default screen, then applies body tints.
    Result<> configure_model(bool forceTextureUpdate);

    /// Viewer notification that a model finished loading.
    Result<> on_model_loaded();

    /// True when the current view has something to export.
    bool can_export() const noexcept;

    // ── Accessors ──────────────────────────────────────────────────────

    const DeviceDescriptor* active_device() const noexcept
    {
        return m_device ? &*m_device : nullptr;
    }

    const DeviceAssets* assets() const noexcept
    {
        return m_assets.get();
    }

    ViewMode view_mode() const noexcept
    {
        return m_viewMode;
    }

    bool texture_dirty() const noexcept
    {
        return m_textureDirty;
    }

    const std::shared_ptr<const TextureData>& user_image() const noexcept
    {
        return m_userImage;
    }

    /// Recommended upload size for the active device (empty when unknown).
    std::string screen_dimensions_label() const;

    ScreenMaterialBindings& bindings() noexcept
    {
        return m_bindings;
    }

    SolidTextureCache& solid_textures() noexcept
    {
        return m_solidTextures;
    }

  private:
    struct PendingRequest
    {
        RequestFence::Ticket ticket{};
        PendingAssets assets;
    };

    bool has_view(ViewMode mode) const noexcept;
    void report(const Result<>& result, std::string_view action) const;

    const DeviceCatalog& m_catalog;
    AssetCache& m_assetCache;
    IModelViewer* m_viewer{nullptr};

    ScreenMaterialBindings m_bindings;
    ScreenMaterialResolver m_resolver{m_bindings};
    ScreenApplier m_screenApplier{m_resolver};
    SolidTextureCache m_solidTextures;
    BodyTint m_bodyTint{m_solidTextures};

    std::optional<DeviceDescriptor> m_device;
    DeviceAssetsPtr m_assets;
    std::shared_ptr<const TextureData> m_userImage;
    ViewMode m_viewMode{ViewMode::Flat};
    bool m_textureDirty{false};

    RequestFence m_fence;
    std::vector<PendingRequest> m_inFlight;
};

MKS_RESTORE_DLL_WARNINGS
