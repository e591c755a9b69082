#include "../Public/ScreenApplier.hpp"
#include "../../Assets/Public/TextureData.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "../../Compositing/Public/Canvas.hpp"
#include "../../Viewer/Public/IModelViewer.hpp"
#include "../Public/MaterialMutator.hpp"

#include <string_view>

#include <fmt/core.h>

namespace
{
void warn_if_failed(const Result<MutationPath>& result, std::string_view materialName)
{
    if (!result)
        fmt::print(stderr, "ScreenApplier: {} ('{}')\n", result.error().message, materialName);
}
} // namespace

void ScreenApplier::reset_screen_material(const MaterialMutator& mutator, IMaterialSurface& material,
                                          const DeviceDescriptor& device) const
{
    const std::string_view name = material.name();
    const float emissiveStrength = device.emissiveStrength.value_or(1.0f);

    warn_if_failed(mutator.clear_texture(material, TextureSlot::BaseColor), name);

    const Color baseColor = device.screenUnlit ? Color{1.0f, 1.0f, 1.0f, 1.0f} : Color{0.0f, 0.0f, 0.0f, 1.0f};
    warn_if_failed(mutator.write_color(material, ColorProperty::BaseColorFactor, baseColor), name);
    warn_if_failed(mutator.write_alpha_mode(material, AlphaMode::Opaque), name);

    warn_if_failed(mutator.write_color(material, ColorProperty::EmissiveFactor,
                                       Color{emissiveStrength, emissiveStrength, emissiveStrength}),
                   name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::EmissiveStrength, emissiveStrength), name);

    warn_if_failed(mutator.write_scalar(material, ScalarProperty::MetallicFactor, 0.0f), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::RoughnessFactor, 1.0f), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::ClearcoatFactor, 0.0f), name);
    warn_if_failed(mutator.write_scalar(material, ScalarProperty::ClearcoatRoughnessFactor, 1.0f), name);

    // Baked textures would otherwise show through the painted screen.
    for (const TextureSlot slot :
         {TextureSlot::Emissive, TextureSlot::Normal, TextureSlot::MetallicRoughness, TextureSlot::Occlusion})
    {
        warn_if_failed(mutator.clear_texture(material, slot), name);
    }

    if (device.screenUnlit)
        warn_if_failed(mutator.write_unlit(material, true), name);
}

Result<std::vector<TextureSlot>> ScreenApplier::paint_screen_texture(IModelViewer& viewer,
                                                                     const DeviceDescriptor& device,
                                                                     const DeviceAssets* assets,
                                                                     const TextureData& userImage)
{
    if (!viewer.has_model())
        return make_error(fmt::format("No model loaded for device: {}", device.name), ErrorCode::ModelNotLoaded);
    if (!viewer.supports_texture_creation())
        return make_error("Viewer cannot create textures", ErrorCode::TextureCreationUnavailable);

    const auto materials = viewer.materials();
    IMaterialSurface* material = m_resolver.resolve(device, materials);
    if (!material)
        return make_error(fmt::format("No screen material found for device: {}", device.name),
                          ErrorCode::MaterialNotFound);

    fmt::print("ScreenApplier: found screen material '{}'\n", material->name());

    const MaterialMutator mutator = MaterialMutator::for_viewer(viewer);
    reset_screen_material(mutator, *material, device);

    auto atlas = m_painter.paint(userImage, device, assets);
    if (!atlas)
    {
        fmt::print(stderr, "ScreenApplier: {}\n", atlas.error().message);
        return std::vector<TextureSlot>{};
    }

    auto texture = viewer.create_texture(atlas.value());
    if (!texture)
        return make_error(texture.error());

    const float emissiveStrength = device.emissiveStrength.value_or(1.0f);
    const auto candidates = MaterialMutator::candidate_slots(device.screenTextureSlot);

    std::vector<TextureSlot> appliedSlots;
    for (const TextureSlot slot : candidates)
    {
        auto written = mutator.write_texture(*material, slot, texture.value());
        if (!written)
            continue;

        if (slot == TextureSlot::Emissive)
            warn_if_failed(mutator.write_color(*material, ColorProperty::EmissiveFactor,
                                               Color{emissiveStrength, emissiveStrength, emissiveStrength}),
                           material->name());

        fmt::print("ScreenApplier: applied texture to {} via {}\n", to_string(slot), to_string(written.value()));
        appliedSlots.push_back(slot);
    }

    if (appliedSlots.empty())
        return make_error(fmt::format("Unable to assign texture to screen material '{}' (preferred slot: {})",
                                      material->name(),
                                      to_string(device.screenTextureSlot.value_or(TextureSlot::BaseColor))),
                          ErrorCode::TextureApplicationExhausted);

    viewer.request_render();
    return appliedSlots;
}

Result<std::optional<TextureSlot>> ScreenApplier::set_default_screen(IModelViewer& viewer,
                                                                      const DeviceDescriptor& device)
{
    if (!viewer.has_model() || !viewer.supports_texture_creation())
        return std::optional<TextureSlot>{};

    const auto materials = viewer.materials();
    IMaterialSurface* material = m_resolver.resolve(device, materials);
    if (!material)
        return std::optional<TextureSlot>{};

    TextureData raster = TextureData::create("default-screen", kDefaultScreenSize, kDefaultScreenSize);
    Canvas(raster).fill(kDefaultScreenColor);

    auto texture = viewer.create_texture(raster);
    if (!texture)
        return make_error(texture.error());

    const MaterialMutator mutator = MaterialMutator::for_viewer(viewer);
    for (const TextureSlot slot : MaterialMutator::candidate_slots(device.screenTextureSlot))
    {
        if (!mutator.write_texture(*material, slot, texture.value()))
            continue;

        if (slot == TextureSlot::Emissive)
            warn_if_failed(mutator.write_color(*material, ColorProperty::EmissiveFactor, Color{0.0f, 0.0f, 0.0f}),
                           material->name());

        viewer.request_render();
        return std::optional<TextureSlot>{slot};
    }
    return std::optional<TextureSlot>{};
}
