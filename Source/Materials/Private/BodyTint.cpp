#include "../Public/BodyTint.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../../Viewer/Public/IModelViewer.hpp"
#include "../Public/MaterialMutator.hpp"
#include "../Public/SolidTextureCache.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include <fmt/core.h>

namespace
{
bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

void warn_if_failed(const Result<MutationPath>& result, std::string_view materialName)
{
    if (!result)
        fmt::print(stderr, "BodyTint: {} ('{}')\n", result.error().message, materialName);
}
} // namespace

size_t BodyTint::apply(IModelViewer& viewer, const DeviceDescriptor& device)
{
    if (!viewer.has_model() || device.bodyMaterials.empty())
        return 0;

    const auto materials = viewer.materials();
    const MaterialMutator mutator = MaterialMutator::for_viewer(viewer);

    size_t applied = 0;
    for (const BodyMaterialTint& descriptor : device.bodyMaterials)
    {
        if (descriptor.name.empty())
            continue;

        auto it = std::find_if(materials.begin(), materials.end(), [&](const IMaterialSurface* material) {
            return material && equals_ignore_case(material->name(), descriptor.name);
        });
        if (it == materials.end())
        {
            fmt::print("BodyTint: material \"{}\" not found in model\n", descriptor.name);
            continue;
        }

        if (descriptor.hide)
            hide(mutator, **it);
        else
            tint(viewer, mutator, **it, descriptor);
        ++applied;
    }

    viewer.request_render();
    return applied;
}

void BodyTint::hide(const MaterialMutator& mutator, IMaterialSurface& material) const
{
    const std::string_view name = material.name();
    for (size_t i = 0; i < kTextureSlotCount; ++i)
    {
        warn_if_failed(mutator.clear_texture(material, static_cast<TextureSlot>(i)), name);
    }

    warn_if_failed(mutator.write_alpha_mode(material, AlphaMode::Mask), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::AlphaCutoff, 1.0f), name);
    warn_if_failed(mutator.write_color(material, ColorProperty::BaseColorFactor, Color{0.0f, 0.0f, 0.0f, 0.0f}), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::MetallicFactor, 0.0f), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::RoughnessFactor, 1.0f), name);
    warn_if_failed(mutator.write_color(material, ColorProperty::EmissiveFactor, Color{0.0f, 0.0f, 0.0f}), name);
}

void BodyTint::tint(IModelViewer& viewer, const MaterialMutator& mutator, IMaterialSurface& material,
                    const BodyMaterialTint& descriptor)
{
    const std::string_view name = material.name();
    fmt::print("BodyTint: applying ({}) to material \"{}\"\n", descriptor.color.key(), name);

    warn_if_failed(mutator.clear_texture(material, TextureSlot::BaseColor), name);
    warn_if_failed(mutator.write_color(material, ColorProperty::BaseColorFactor, descriptor.color), name);
    if (descriptor.color.a() < 1.0f)
    {
        warn_if_failed(mutator.write_alpha_mode(material, AlphaMode::Blend), name);
        warn_if_failed(mutator.write_scalar(material, ScalarProperty::AlphaCutoff, 0.0f), name);
    }

    if (descriptor.metallicFactor)
        warn_if_failed(mutator.write_scalar(material, ScalarProperty::MetallicFactor,
                                            std::clamp(*descriptor.metallicFactor, 0.0f, 1.0f)),
                       name);
    if (descriptor.roughnessFactor)
        warn_if_failed(mutator.write_scalar(material, ScalarProperty::RoughnessFactor,
                                            std::clamp(*descriptor.roughnessFactor, 0.0f, 1.0f)),
                       name);
    if (descriptor.emissiveFactor)
    {
        const auto& e = *descriptor.emissiveFactor;
        warn_if_failed(mutator.write_color(material, ColorProperty::EmissiveFactor, Color{e.x, e.y, e.z}), name);
    }

    const auto texture = m_solidTextures.get_or_create(viewer, descriptor.color);
    if (!texture)
        return;
    warn_if_failed(mutator.write_texture(material, TextureSlot::BaseColor, *texture), name);
}
