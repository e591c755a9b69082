#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/MaterialData.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/core.h>

MKS_SUPPRESS_DLL_WARNINGS

/// Ways a model viewer may let a material be written, tried in order by MaterialMutator.
enum class MutationPath : std::uint8_t
{
    /// Setter methods on the material itself.
    SetterMethod,
    /// Setters on the nested PBR (metallic-roughness) sub-object.
    NestedPbrSetter,
    /// set_texture on the per-slot texture-info object.
    TextureInfoSetter,
    /// Plain property assignment.
    DirectProperty,
};

inline constexpr std::array<MutationPath, 4> kDefaultMutationOrder{
    MutationPath::SetterMethod,
    MutationPath::NestedPbrSetter,
    MutationPath::TextureInfoSetter,
    MutationPath::DirectProperty,
};

constexpr std::string_view to_string(MutationPath path) noexcept
{
    switch (path)
    {
    case MutationPath::SetterMethod:
        return "setter";
    case MutationPath::NestedPbrSetter:
        return "pbr-setter";
    case MutationPath::TextureInfoSetter:
        return "texture-info";
    case MutationPath::DirectProperty:
        return "property";
    }
    return "unknown";
}

/// One mutation path of a material. Every write defaults to MutationUnsupported;
/// adapters override only what the path actually offers.
class MKS_EXPORT IMaterialFacet
{
  public:
    virtual ~IMaterialFacet() = default;

    /// Binds a texture to the slot, or clears it when the handle is empty.
    virtual Result<> set_texture(TextureSlot slot, std::optional<TextureHandle> /*texture*/)
    {
        return unsupported(to_string(slot));
    }

    virtual Result<> set_color(ColorProperty property, const Color& /*color*/)
    {
        return unsupported(to_string(property));
    }

    virtual Result<> set_scalar(ScalarProperty property, float /*value*/)
    {
        return unsupported(to_string(property));
    }

    virtual Result<> set_alpha_mode(AlphaMode /*mode*/)
    {
        return unsupported("alphaMode");
    }

    virtual Result<> set_unlit(bool /*unlit*/)
    {
        return unsupported("unlit");
    }

  protected:
    static std::unexpected<Error> unsupported(std::string_view what)
    {
        return make_error(fmt::format("'{}' is not writable through this path", what), ErrorCode::MutationUnsupported);
    }
};

/// A named material of a loaded model, exposing the mutation paths its viewer supports.
class MKS_EXPORT IMaterialSurface
{
  public:
    virtual ~IMaterialSurface() = default;

    virtual std::string_view name() const noexcept = 0;

    /// Returns the facet for the path, or nullptr when the material does not offer it.
    virtual IMaterialFacet* facet(MutationPath path) noexcept = 0;
};

MKS_RESTORE_DLL_WARNINGS
