#include "../Public/OfflineModelViewer.hpp"

#include <algorithm>
#include <string>

#include <fmt/core.h>

namespace
{
void store(DirectX::XMFLOAT4& target, const Color& color) noexcept
{
    target = color.to_float4();
}

void store(DirectX::XMFLOAT3& target, const Color& color) noexcept
{
    target = color.to_float3();
}

/// Writes through material setter methods.
class SetterFacet final : public IMaterialFacet
{
  public:
    SetterFacet(MaterialData& material, const OfflineModelViewer& viewer) noexcept
        : m_material(material), m_viewer(viewer)
    {}

    Result<> set_texture(TextureSlot slot, std::optional<TextureHandle> texture) override
    {
        if (texture && !m_viewer.contains_texture(*texture))
            return make_error(fmt::format("Unknown texture handle {} for {}", texture->id, to_string(slot)),
                              ErrorCode::AssetInvalidData);
        m_material.texture(slot) = texture;
        return {};
    }

    Result<> set_color(ColorProperty property, const Color& color) override
    {
        if (property == ColorProperty::BaseColorFactor)
            store(m_material.baseColorFactor, color);
        else
            store(m_material.emissiveFactor, color);
        return {};
    }

    Result<> set_scalar(ScalarProperty property, float value) override
    {
        if (property != ScalarProperty::EmissiveStrength)
            return unsupported(to_string(property));
        m_material.emissiveStrength = value;
        return {};
    }

    Result<> set_alpha_mode(AlphaMode mode) override
    {
        m_material.alphaMode = mode;
        return {};
    }

  private:
    MaterialData& m_material;
    const OfflineModelViewer& m_viewer;
};

/// Writes material fields directly.
class PropertyFacet final : public IMaterialFacet
{
  public:
    explicit PropertyFacet(MaterialData& material) noexcept : m_material(material)
    {}

    Result<> set_color(ColorProperty property, const Color& color) override
    {
        if (property == ColorProperty::BaseColorFactor)
            store(m_material.baseColorFactor, color);
        else
            store(m_material.emissiveFactor, color);
        return {};
    }

    Result<> set_scalar(ScalarProperty property, float value) override
    {
        switch (property)
        {
        case ScalarProperty::MetallicFactor:
            m_material.metallic = value;
            break;
        case ScalarProperty::RoughnessFactor:
            m_material.roughness = value;
            break;
        case ScalarProperty::EmissiveStrength:
            m_material.emissiveStrength = value;
            break;
        case ScalarProperty::AlphaCutoff:
            m_material.alphaCutoff = value;
            break;
        case ScalarProperty::ClearcoatFactor:
            m_material.clearcoat = value;
            break;
        case ScalarProperty::ClearcoatRoughnessFactor:
            m_material.clearcoatRoughness = value;
            break;
        }
        return {};
    }

    Result<> set_alpha_mode(AlphaMode mode) override
    {
        m_material.alphaMode = mode;
        return {};
    }

    Result<> set_unlit(bool unlit) override
    {
        m_material.unlit = unlit;
        return {};
    }

  private:
    MaterialData& m_material;
};
} // namespace

/// Working copy of one loaded material plus its two facets.
class OfflineMaterial final : public IMaterialSurface
{
  public:
    OfflineMaterial(MaterialData data, const OfflineModelViewer& viewer)
        : m_data(std::move(data)), m_setter(m_data, viewer), m_property(m_data)
    {}

    OfflineMaterial(const OfflineMaterial&) = delete;
    OfflineMaterial& operator=(const OfflineMaterial&) = delete;

    std::string_view name() const noexcept override
    {
        return m_data.name;
    }

    IMaterialFacet* facet(MutationPath path) noexcept override
    {
        switch (path)
        {
        case MutationPath::SetterMethod:
            return &m_setter;
        case MutationPath::DirectProperty:
            return &m_property;
        default:
            return nullptr;
        }
    }

    const MaterialData& data() const noexcept
    {
        return m_data;
    }

  private:
    MaterialData m_data;
    SetterFacet m_setter;
    PropertyFacet m_property;
};

OfflineModelViewer::OfflineModelViewer(bool textureCreation)
    : m_modelCache(ModelLoader{}), m_textureCache(TextureLoader{}), m_textureCreation(textureCreation)
{}

OfflineModelViewer::~OfflineModelViewer() = default;

entt::id_type OfflineModelViewer::path_to_id(const std::filesystem::path& path)
{
    const std::string key = path.generic_string();
    return entt::hashed_string{key.data(), key.size()};
}

Result<> OfflineModelViewer::load_model(const std::filesystem::path& path)
{
    const auto id = path_to_id(path);
    auto [it, inserted] = m_modelCache.load(id, path);
    if (!it->second)
    {
        m_modelCache.erase(id);
        return make_error(fmt::format("Failed to load model: {}", path.string()), ErrorCode::ModelNotLoaded);
    }

    const ModelData& model = *it->second;

    m_materials.clear();
    m_materials.reserve(model.materials.size());
    for (const auto& material : model.materials)
    {
        m_materials.push_back(std::make_unique<OfflineMaterial>(material, *this));
    }
    m_modelPath = path;

    fmt::print("OfflineModelViewer: loaded '{}' ({} materials{})\n", model.name, model.materials.size(),
               inserted ? "" : ", cached");
    return {};
}

std::vector<IMaterialSurface*> OfflineModelViewer::materials()
{
    std::vector<IMaterialSurface*> surfaces;
    surfaces.reserve(m_materials.size());
    for (auto& material : m_materials)
    {
        surfaces.push_back(material.get());
    }
    return surfaces;
}

Result<TextureHandle> OfflineModelViewer::create_texture(const TextureData& raster)
{
    if (!m_textureCreation)
        return make_error("Texture creation is not available", ErrorCode::TextureCreationUnavailable);
    if (raster.empty())
        return make_error(fmt::format("Cannot create texture from empty raster '{}'", raster.name),
                          ErrorCode::InvalidRaster);

    const TextureHandle handle{m_nextTextureId++};
    auto [it, inserted] = m_textureCache.load(handle.id, raster);
    if (!it->second)
        return make_error(fmt::format("Failed to store texture '{}'", raster.name), ErrorCode::AssetInvalidData);
    return handle;
}

const MaterialData* OfflineModelViewer::material(std::string_view name) const noexcept
{
    auto it = std::find_if(m_materials.begin(), m_materials.end(),
                           [&](const std::unique_ptr<OfflineMaterial>& material) { return material->name() == name; });
    return it != m_materials.end() ? &(*it)->data() : nullptr;
}

const TextureData* OfflineModelViewer::texture(TextureHandle handle) const
{
    if (!m_textureCache.contains(handle.id))
        return nullptr;
    auto resource = m_textureCache[handle.id];
    return resource ? &*resource : nullptr;
}
