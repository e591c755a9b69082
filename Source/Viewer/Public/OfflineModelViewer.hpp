#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Assets/Private/ModelLoader.hpp"
#include "../../Assets/Private/TextureLoader.hpp"
#include "../../Assets/Public/MaterialData.hpp"
#include "../../Assets/Public/ModelData.hpp"
#include "../../Assets/Public/TextureData.hpp"
#include "IModelViewer.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <entt/core/hashed_string.hpp>
#include <entt/resource/cache.hpp>
#include <entt/resource/resource.hpp>

class OfflineMaterial;

MKS_SUPPRESS_DLL_WARNINGS

/// Headless IModelViewer over OBJ+MTL material tables.
///
/// Models are parsed once by ModelLoader and deduplicated in an entt::resource_cache; each
/// load_model() gets a fresh working copy of the materials, so edits never leak into the
/// cache. Materials offer the SetterMethod and DirectProperty paths:
///   - SetterMethod writes textures, colors, alpha mode and emissive strength
///   - DirectProperty writes colors, every scalar, alpha mode and the unlit flag
/// Created textures are kept CPU-side so they can be exported.
class MKS_EXPORT OfflineModelViewer final : public IModelViewer
{
  public:
    explicit OfflineModelViewer(bool textureCreation = true);
    ~OfflineModelViewer() override;

    OfflineModelViewer(const OfflineModelViewer&) = delete;
    OfflineModelViewer& operator=(const OfflineModelViewer&) = delete;

    // ── IModelViewer ───────────────────────────────────────────────────

    Result<> load_model(const std::filesystem::path& path) override;

    const std::filesystem::path& model_path() const noexcept override
    {
        return m_modelPath;
    }

    bool has_model() const noexcept override
    {
        return !m_materials.empty();
    }

    std::vector<IMaterialSurface*> materials() override;

    std::span<const MutationPath> mutation_paths() const noexcept override
    {
        return kOfflineMutationOrder;
    }

    bool supports_texture_creation() const noexcept override
    {
        return m_textureCreation;
    }

    Result<TextureHandle> create_texture(const TextureData& raster) override;

    void request_render() noexcept override
    {
        ++m_renderRequests;
    }

    void apply_settings(const ViewerSettings& settings) override
    {
        m_settings = settings;
    }

    // ── Inspection ─────────────────────────────────────────────────────

    /// Returns the working material with the given exact name, or nullptr.
    const MaterialData* material(std::string_view name) const noexcept;

    /// Returns the raster behind a handle issued by create_texture(), or nullptr.
    const TextureData* texture(TextureHandle handle) const;

    bool contains_texture(TextureHandle handle) const
    {
        return m_textureCache.contains(handle.id);
    }

    size_t texture_count() const noexcept
    {
        return m_textureCache.size();
    }

    size_t model_count() const noexcept
    {
        return m_modelCache.size();
    }

    const std::optional<ViewerSettings>& settings() const noexcept
    {
        return m_settings;
    }

    std::uint32_t render_requests() const noexcept
    {
        return m_renderRequests;
    }

  private:
    static constexpr std::array<MutationPath, 2> kOfflineMutationOrder{
        MutationPath::SetterMethod,
        MutationPath::DirectProperty,
    };

    static entt::id_type path_to_id(const std::filesystem::path& path);

    entt::resource_cache<ModelData, ModelLoader> m_modelCache;
    entt::resource_cache<TextureData, TextureLoader> m_textureCache;

    std::filesystem::path m_modelPath;
    std::vector<std::unique_ptr<OfflineMaterial>> m_materials;
    std::optional<ViewerSettings> m_settings;

    bool m_textureCreation{true};
    std::uint32_t m_nextTextureId{1};
    std::uint32_t m_renderRequests{0};
};

MKS_RESTORE_DLL_WARNINGS
