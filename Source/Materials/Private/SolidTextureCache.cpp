#include "../Public/SolidTextureCache.hpp"
#include "../../Compositing/Public/Canvas.hpp"
#include "../../Viewer/Public/IModelViewer.hpp"

#include <string>

#include <fmt/core.h>

entt::id_type SolidTextureCache::slot_for(const std::string& key) const
{
    entt::id_type id = entt::hashed_string{key.data(), key.size()};
    while (m_textures.contains(id) && m_textures[id]->key != key)
        ++id;
    return id;
}

std::optional<TextureHandle> SolidTextureCache::get_or_create(IModelViewer& viewer, const Color& color)
{
    std::string key = color.key();
    const auto id = slot_for(key);
    if (m_textures.contains(id))
        return m_textures[id]->handle;

    if (!viewer.supports_texture_creation())
        return std::nullopt;

    auto handle = viewer.create_texture(render(color));
    if (!handle)
    {
        fmt::print(stderr, "SolidTextureCache: failed to create texture for ({}): {}\n", key,
                   handle.error().message);
        return std::nullopt;
    }

    m_textures.load(id, SolidTexture{handle.value(), color, std::move(key)});
    return handle.value();
}

bool SolidTextureCache::contains(const Color& color) const
{
    return m_textures.contains(slot_for(color.key()));
}

TextureData SolidTextureCache::render(const Color& color)
{
    TextureData raster = TextureData::create(fmt::format("solid({})", color.key()), 1, 1);
    Canvas(raster).fill(color);
    return raster;
}
