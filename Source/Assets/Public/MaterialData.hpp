#pragma once
#include "../../Core/Public/Core.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <DirectXMath.h>

MKS_SUPPRESS_DLL_WARNINGS

/// Named texture binding points of a PBR material.
enum class TextureSlot : std::uint8_t
{
    BaseColor = 0,
    Emissive,
    Normal,
    MetallicRoughness,
    Occlusion,
};

inline constexpr size_t kTextureSlotCount{5};

enum class ColorProperty : std::uint8_t
{
    BaseColorFactor,
    EmissiveFactor,
};

enum class ScalarProperty : std::uint8_t
{
    MetallicFactor,
    RoughnessFactor,
    EmissiveStrength,
    AlphaCutoff,
    ClearcoatFactor,
    ClearcoatRoughnessFactor,
};

enum class AlphaMode : std::uint8_t
{
    Opaque,
    Mask,
    Blend,
};

/// Opaque texture reference issued by a model viewer.
struct TextureHandle
{
    std::uint32_t id{};

    constexpr bool operator==(const TextureHandle&) const noexcept = default;
};

constexpr std::string_view to_string(TextureSlot slot) noexcept
{
    switch (slot)
    {
    case TextureSlot::BaseColor:
        return "baseColorTexture";
    case TextureSlot::Emissive:
        return "emissiveTexture";
    case TextureSlot::Normal:
        return "normalTexture";
    case TextureSlot::MetallicRoughness:
        return "metallicRoughnessTexture";
    case TextureSlot::Occlusion:
        return "occlusionTexture";
    }
    return "unknownTexture";
}

constexpr std::optional<TextureSlot> texture_slot_from_string(std::string_view name) noexcept
{
    for (size_t i = 0; i < kTextureSlotCount; ++i)
    {
        const auto slot = static_cast<TextureSlot>(i);
        if (to_string(slot) == name)
            return slot;
    }
    return std::nullopt;
}

constexpr std::string_view to_string(ScalarProperty property) noexcept
{
    switch (property)
    {
    case ScalarProperty::MetallicFactor:
        return "metallicFactor";
    case ScalarProperty::RoughnessFactor:
        return "roughnessFactor";
    case ScalarProperty::EmissiveStrength:
        return "emissiveStrength";
    case ScalarProperty::AlphaCutoff:
        return "alphaCutoff";
    case ScalarProperty::ClearcoatFactor:
        return "clearcoatFactor";
    case ScalarProperty::ClearcoatRoughnessFactor:
        return "clearcoatRoughnessFactor";
    }
    return "unknownFactor";
}

constexpr std::string_view to_string(ColorProperty property) noexcept
{
    return property == ColorProperty::BaseColorFactor ? "baseColorFactor" : "emissiveFactor";
}

constexpr std::string_view to_string(AlphaMode mode) noexcept
{
    switch (mode)
    {
    case AlphaMode::Opaque:
        return "OPAQUE";
    case AlphaMode::Mask:
        return "MASK";
    case AlphaMode::Blend:
        return "BLEND";
    }
    return "OPAQUE";
}

/// CPU-side PBR material state.
/// Loaded from MTL by ModelLoader and mutated by OfflineModelViewer facets.
struct MKS_EXPORT MaterialData
{
    /// Material identifier from source asset.
    std::string name{};

    /// Base color factor (RGBA).
    DirectX::XMFLOAT4 baseColorFactor{1.0f, 1.0f, 1.0f, 1.0f};
    /// Emissive color factor (RGB).
    DirectX::XMFLOAT3 emissiveFactor{0.0f, 0.0f, 0.0f};
    float emissiveStrength{1.0f};
    /// Perceptual roughness in [0, 1].
    float roughness{0.5f};
    /// Metallic factor in [0, 1].
    float metallic{0.0f};
    float clearcoat{0.0f};
    float clearcoatRoughness{0.0f};

    AlphaMode alphaMode{AlphaMode::Opaque};
    float alphaCutoff{0.5f};
    bool unlit{false};

    /// Bound runtime textures, indexed by TextureSlot.
    std::array<std::optional<TextureHandle>, kTextureSlotCount> textures{};

    std::optional<TextureHandle>& texture(TextureSlot slot) noexcept
    {
        return textures[static_cast<size_t>(slot)];
    }
    const std::optional<TextureHandle>& texture(TextureSlot slot) const noexcept
    {
        return textures[static_cast<size_t>(slot)];
    }
};

MKS_RESTORE_DLL_WARNINGS
