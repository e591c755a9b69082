#pragma once
#include <Assets/Public/MaterialData.hpp>
#include <Assets/Public/TextureData.hpp>
#include <Catalog/Public/DeviceDescriptor.hpp>
#include <Viewer/Public/IModelViewer.hpp>
#include <Viewer/Public/MaterialSurface.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

/// Facet writing into MaterialData, with switches to refuse whole operation kinds.
class RecordingFacet final : public IMaterialFacet
{
  public:
    explicit RecordingFacet(MaterialData& data) : m_data(data)
    {}

    bool acceptsTextures{true};
    bool acceptsColors{true};
    bool acceptsScalars{true};
    bool acceptsAlphaMode{true};
    bool acceptsUnlit{true};
    /// Slots that refuse a texture (clearing them still works).
    std::set<TextureSlot> rejectedSlots{};
    int writes{0};

    Result<> set_texture(TextureSlot slot, std::optional<TextureHandle> texture) override
    {
        if (!acceptsTextures || (texture && rejectedSlots.contains(slot)))
            return unsupported(to_string(slot));
        m_data.texture(slot) = texture;
        ++writes;
        return {};
    }

    Result<> set_color(ColorProperty property, const Color& color) override
    {
        if (!acceptsColors)
            return unsupported(to_string(property));
        if (property == ColorProperty::BaseColorFactor)
            m_data.baseColorFactor = color.to_float4();
        else
            m_data.emissiveFactor = color.to_float3();
        ++writes;
        return {};
    }

    Result<> set_scalar(ScalarProperty property, float value) override
    {
        if (!acceptsScalars)
            return unsupported(to_string(property));
        switch (property)
        {
        case ScalarProperty::MetallicFactor:
            m_data.metallic = value;
            break;
        case ScalarProperty::RoughnessFactor:
            m_data.roughness = value;
            break;
        case ScalarProperty::EmissiveStrength:
            m_data.emissiveStrength = value;
            break;
        case ScalarProperty::AlphaCutoff:
            m_data.alphaCutoff = value;
            break;
        case ScalarProperty::ClearcoatFactor:
            m_data.clearcoat = value;
            break;
        case ScalarProperty::ClearcoatRoughnessFactor:
            m_data.clearcoatRoughness = value;
            break;
        }
        ++writes;
        return {};
    }

    Result<> set_alpha_mode(AlphaMode mode) override
    {
        if (!acceptsAlphaMode)
            return unsupported("alphaMode");
        m_data.alphaMode = mode;
        ++writes;
        return {};
    }

    Result<> set_unlit(bool unlit) override
    {
        if (!acceptsUnlit)
            return unsupported("unlit");
        m_data.unlit = unlit;
        ++writes;
        return {};
    }

  private:
    MaterialData& m_data;
};

/// Material offering only the paths a test opts into.
class FakeMaterial final : public IMaterialSurface
{
  public:
    explicit FakeMaterial(std::string name)
    {
        data.name = std::move(name);
        data.roughness = 0.5f;
        data.metallic = 0.5f;
    }

    MaterialData data;

    /// Adds (or returns) the facet for the path.
    RecordingFacet& offer(MutationPath path)
    {
        auto& facet = m_facets[path];
        if (!facet)
            facet = std::make_unique<RecordingFacet>(data);
        return *facet;
    }

    std::string_view name() const noexcept override
    {
        return data.name;
    }

    IMaterialFacet* facet(MutationPath path) noexcept override
    {
        auto it = m_facets.find(path);
        return it != m_facets.end() ? it->second.get() : nullptr;
    }

  private:
    std::map<MutationPath, std::unique_ptr<RecordingFacet>> m_facets;
};

/// In-memory viewer: load_model() succeeds for any path and exposes the preset materials.
class FakeViewer final : public IModelViewer
{
  public:
    bool textureCreation{true};
    bool failLoads{false};
    int loads{0};
    int renders{0};
    std::vector<TextureData> created{};
    std::optional<ViewerSettings> settings{};

    /// Adds a material offering the SetterMethod path.
    FakeMaterial& add_material(std::string name)
    {
        m_materials.push_back(std::make_unique<FakeMaterial>(std::move(name)));
        m_materials.back()->offer(MutationPath::SetterMethod);
        return *m_materials.back();
    }

    Result<> load_model(const std::filesystem::path& path) override
    {
        ++loads;
        if (failLoads)
            return make_error("load refused", ErrorCode::ModelNotLoaded);
        m_path = path;
        return {};
    }

    const std::filesystem::path& model_path() const noexcept override
    {
        return m_path;
    }

    bool has_model() const noexcept override
    {
        return !m_path.empty();
    }

    std::vector<IMaterialSurface*> materials() override
    {
        std::vector<IMaterialSurface*> surfaces;
        for (auto& material : m_materials)
            surfaces.push_back(material.get());
        return surfaces;
    }

    bool supports_texture_creation() const noexcept override
    {
        return textureCreation;
    }

    Result<TextureHandle> create_texture(const TextureData& raster) override
    {
        if (!textureCreation)
            return make_error("no textures", ErrorCode::TextureCreationUnavailable);
        created.push_back(raster);
        return TextureHandle{static_cast<std::uint32_t>(created.size())};
    }

    void request_render() noexcept override
    {
        ++renders;
    }

    void apply_settings(const ViewerSettings& viewerSettings) override
    {
        settings = viewerSettings;
    }

  private:
    std::filesystem::path m_path{};
    std::vector<std::unique_ptr<FakeMaterial>> m_materials{};
};

/// Solid raster of one RGBA8 color.
inline TextureData make_solid(std::uint32_t width, std::uint32_t height, std::uint8_t r, std::uint8_t g,
                              std::uint8_t b, std::uint8_t a = 255)
{
    TextureData texture = TextureData::create("solid", width, height);
    for (std::uint32_t y = 0; y < height; ++y)
    {
        for (std::uint32_t x = 0; x < width; ++x)
        {
            std::uint8_t* p = texture.pixel(x, y);
            p[0] = r;
            p[1] = g;
            p[2] = b;
            p[3] = a;
        }
    }
    return texture;
}

/// Left half opaque red, right half opaque green.
inline TextureData make_split(std::uint32_t width, std::uint32_t height)
{
    TextureData texture = make_solid(width, height, 255, 0, 0);
    for (std::uint32_t y = 0; y < height; ++y)
    {
        for (std::uint32_t x = width / 2; x < width; ++x)
        {
            std::uint8_t* p = texture.pixel(x, y);
            p[0] = 0;
            p[1] = 255;
        }
    }
    return texture;
}

inline bool pixel_is(const TextureData& texture, std::uint32_t x, std::uint32_t y, std::uint8_t r, std::uint8_t g,
                     std::uint8_t b, std::uint8_t a = 255)
{
    const std::uint8_t* p = texture.pixel(x, y);
    return p[0] == r && p[1] == g && p[2] == b && p[3] == a;
}
