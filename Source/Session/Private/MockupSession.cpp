#include "../Public/MockupSession.hpp"
#include "../../Compositing/Public/FlatCompositor.hpp"
#include "../../Viewer/Public/IModelViewer.hpp"

#include <chrono>

#include <fmt/core.h>

MockupSession::MockupSession(const DeviceCatalog& catalog, AssetCache& assetCache, IModelViewer* viewer)
    : m_catalog{catalog}, m_assetCache{assetCache}, m_viewer{viewer}
{}

void MockupSession::report(const Result<>& result, std::string_view action) const
{
    if (!result)
        fmt::print(stderr, "MockupSession: failed to {}: {}\n", action, result.error().message);
}

bool MockupSession::has_view(ViewMode mode) const noexcept
{
    if (!m_device)
        return false;
    return mode == ViewMode::Flat ? m_device->has2DAssets : m_device->has_model();
}

// ── Device ───────────────────────────────────────────────────────────

Result<> MockupSession::select_device(std::string_view deviceId)
{
    const DeviceDescriptor* device = m_catalog.find(deviceId);
    if (!device)
        return make_error(fmt::format("Unknown device: {}", deviceId), ErrorCode::DeviceNotFound);
    if (m_device && m_device->id == device->id)
        return {};

    m_device = *device;
    m_assets.reset();

    m_viewMode = (!device->has2DAssets && device->has_model()) ? ViewMode::Model : ViewMode::Flat;
    m_textureDirty = static_cast<bool>(m_userImage);

    const RequestFence::Ticket ticket = m_fence.advance();
    m_inFlight.push_back(PendingRequest{ticket, m_assetCache.load_assets(*m_device)});

    fmt::print("MockupSession: selected {} (view {}, has2D {}, hasModel {})\n", m_device->name, to_string(m_viewMode),
               m_device->has2DAssets, m_device->has_model());
    return {};
}

bool MockupSession::poll_assets(bool wait)
{
    bool applied = false;
    for (auto it = m_inFlight.begin(); it != m_inFlight.end();)
    {
        const bool current = m_fence.is_current(it->ticket);
        const bool ready = it->assets.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        if (!ready && !(wait && current))
        {
            ++it;
            continue;
        }

        DeviceAssetsPtr assets = it->assets.get();
        it = m_inFlight.erase(it);

        if (!current)
        {
            fmt::print("MockupSession: dropping assets of a superseded selection\n");
            continue;
        }

        m_assets = std::move(assets);
        applied = true;
        if (!m_assets)
            fmt::print("MockupSession: no 2D assets for {}\n", m_device->name);
    }

    if (applied && m_viewMode == ViewMode::Model)
        report(configure_model(true), "configure 3D viewer");
    return applied;
}

// ── Input ────────────────────────────────────────────────────────────

void MockupSession::set_user_image(std::shared_ptr<const TextureData> image)
{
    m_userImage = std::move(image);
    m_textureDirty = true;

    if (m_device && m_device->has_model() && m_viewer)
        report(configure_model(true), "update 3D viewer texture");
}

Result<> MockupSession::set_view_mode(ViewMode mode)
{
    if (!has_view(mode))
        return make_error(fmt::format("View '{}' is not available for this device", to_string(mode)),
                          ErrorCode::ViewModeUnavailable);

    const bool changed = m_viewMode != mode;
    m_viewMode = mode;
    if (mode == ViewMode::Model)
        return configure_model(changed || m_textureDirty);
    return {};
}

// ── Output ───────────────────────────────────────────────────────────

void MockupSession::render_flat(TextureData& surface) const noexcept
{
    FlatCompositor::render(surface, m_assets.get(), m_userImage.get(), m_device ? m_device->chromeOffset : 0.0f);
}

TextureData MockupSession::render_flat() const
{
    TextureData surface = FlatCompositor::make_surface(m_assets.get());
    render_flat(surface);
    return surface;
}

Result<> MockupSession::configure_model(bool forceTextureUpdate)
{
    if (!m_viewer || !m_device || !m_device->has_model())
        return {};

    const bool needsLoad = m_viewer->model_path() != m_device->modelPath;
    if (needsLoad)
    {
        fmt::print("MockupSession: loading model for {}\n", m_device->name);
        auto loaded = m_viewer->load_model(m_device->modelPath);
        if (!loaded)
            return loaded;
        m_viewer->apply_settings(resolve_viewer_settings(*m_device));
    }

    if (!m_viewer->has_model())
    {
        fmt::print(stderr, "MockupSession: model not ready yet, skipping texture configuration\n");
        return {};
    }

    if (m_viewer->supports_texture_creation())
    {
        if (m_userImage)
        {
            if (needsLoad || forceTextureUpdate || m_textureDirty)
            {
                auto painted = m_screenApplier.paint_screen_texture(*m_viewer, *m_device, m_assets.get(), *m_userImage);
                if (!painted)
                    return make_error(painted.error());
                if (!painted->empty())
                    m_textureDirty = false;
            }
        }
        else
        {
            auto screen = m_screenApplier.set_default_screen(*m_viewer, *m_device);
            if (!screen)
                return make_error(screen.error());
        }
    }

    m_bodyTint.apply(*m_viewer, *m_device);
    return {};
}

Result<> MockupSession::on_model_loaded()
{
    if (!m_viewer || !m_device)
        return {};

    m_bodyTint.apply(*m_viewer, *m_device);

    if (!m_userImage)
    {
        auto screen = m_screenApplier.set_default_screen(*m_viewer, *m_device);
        if (!screen)
            return make_error(screen.error());
        return {};
    }

    m_textureDirty = true;
    return configure_model(true);
}

bool MockupSession::can_export() const noexcept
{
    if (!m_device)
        return false;
    if (m_viewMode == ViewMode::Model)
        return m_device->has_model();
    return m_userImage && m_assets && m_device->has2DAssets;
}

std::string MockupSession::screen_dimensions_label() const
{
    return m_device ? recommended_resolution(*m_device) : std::string{};
}
