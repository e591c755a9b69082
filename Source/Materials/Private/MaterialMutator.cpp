#include "../Public/MaterialMutator.hpp"
#include "../../Viewer/Public/IModelViewer.hpp"

#include <algorithm>

#include <fmt/core.h>

MaterialMutator::MaterialMutator(std::vector<MutationPath> order) : m_order(std::move(order))
{}

MaterialMutator MaterialMutator::for_viewer(const IModelViewer& viewer)
{
    const auto paths = viewer.mutation_paths();
    return MaterialMutator(std::vector<MutationPath>(paths.begin(), paths.end()));
}

template <typename Write>
Result<MutationPath> MaterialMutator::try_paths(IMaterialSurface& material, std::string_view what, Write&& write) const
{
    for (const MutationPath path : m_order)
    {
        IMaterialFacet* facet = material.facet(path);
        if (!facet)
            continue;
        if (write(*facet))
            return path;
    }
    return make_error(fmt::format("No mutation path could write {} on material '{}'", what, material.name()),
                      ErrorCode::MutationUnsupported);
}

Result<MutationPath> MaterialMutator::write_texture(IMaterialSurface& material, TextureSlot slot,
                                                    TextureHandle texture) const
{
    return try_paths(material, to_string(slot),
                 [&](IMaterialFacet& facet) { return facet.set_texture(slot, texture).has_value(); });
}

Result<MutationPath> MaterialMutator::clear_texture(IMaterialSurface& material, TextureSlot slot) const
{
    return try_paths(material, to_string(slot),
                 [&](IMaterialFacet& facet) { return facet.set_texture(slot, std::nullopt).has_value(); });
}

Result<MutationPath> MaterialMutator::write_color(IMaterialSurface& material, ColorProperty property,
                                                  const Color& color) const
{
    return try_paths(material, to_string(property),
                 [&](IMaterialFacet& facet) { return facet.set_color(property, color).has_value(); });
}

Result<MutationPath> MaterialMutator::write_scalar(IMaterialSurface& material, ScalarProperty property,
                                                   float value) const
{
    return try_paths(material, to_string(property),
                 [&](IMaterialFacet& facet) { return facet.set_scalar(property, value).has_value(); });
}

Result<MutationPath> MaterialMutator::write_alpha_mode(IMaterialSurface& material, AlphaMode mode) const
{
    return try_paths(material, "alphaMode",
                 [&](IMaterialFacet& facet) { return facet.set_alpha_mode(mode).has_value(); });
}

Result<MutationPath> MaterialMutator::write_unlit(IMaterialSurface& material, bool unlit) const
{
    return try_paths(material, "unlit", [&](IMaterialFacet& facet) { return facet.set_unlit(unlit).has_value(); });
}

std::vector<TextureSlot> MaterialMutator::candidate_slots(std::optional<TextureSlot> preferred)
{
    std::vector<TextureSlot> slots{preferred.value_or(TextureSlot::BaseColor)};
    for (const TextureSlot fallback : {TextureSlot::BaseColor, TextureSlot::Emissive})
    {
        if (std::find(slots.begin(), slots.end(), fallback) == slots.end())
            slots.push_back(fallback);
    }
    return slots;
}
