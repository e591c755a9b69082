#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/MaterialData.hpp"
#include "../../Assets/Public/TextureData.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <entt/core/hashed_string.hpp>
#include <entt/resource/cache.hpp>
#include <entt/resource/resource.hpp>

class IModelViewer;

MKS_SUPPRESS_DLL_WARNINGS

/// Viewer texture filled with one color.
struct SolidTexture
{
    TextureHandle handle{};
    Color color{};
    std::string key;
};

/// Color -> 1x1 texture cache. Keyed by the exact RGBA tuple (Color::key()), so each
/// distinct color is rendered and uploaded at most once. Tuples whose hashes collide
/// take the next free id.
class MKS_EXPORT SolidTextureCache
{
  public:
    /// Returns the cached texture for the color, creating it through the viewer on first use.
    /// Returns nullopt (and caches nothing) when the viewer cannot create textures.
    std::optional<TextureHandle> get_or_create(IModelViewer& viewer, const Color& color);

    bool contains(const Color& color) const;

    size_t size() const noexcept
    {
        return m_textures.size();
    }

    void clear() noexcept
    {
        m_textures.clear();
    }

    /// 1x1 raster of the color, each component rounded to 8 bits.
    static TextureData render(const Color& color);

  private:
    /// Id holding this key, or the free id it would be stored under.
    entt::id_type slot_for(const std::string& key) const;

    entt::resource_cache<SolidTexture> m_textures;
};

MKS_RESTORE_DLL_WARNINGS
