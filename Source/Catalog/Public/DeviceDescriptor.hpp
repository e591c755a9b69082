#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/MaterialData.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <DirectXMath.h>

MKS_SUPPRESS_DLL_WARNINGS

/// Sub-rectangle of a texture atlas in normalized UV space (origin bottom-left).
struct UvRect
{
    float uMin{0.0f};
    float vMin{0.0f};
    float uMax{1.0f};
    float vMax{1.0f};
};

/// Color/PBR override for one non-screen material of a device model.
struct BodyMaterialTint
{
    std::string name{};
    Color color{0.07f, 0.07f, 0.09f, 1.0f};
    std::optional<float> metallicFactor{};
    std::optional<float> roughnessFactor{};
    std::optional<DirectX::XMFLOAT3> emissiveFactor{};
    /// Makes the material fully transparent instead of tinting it.
    bool hide{false};
};

/// Presentation parameters handed to the external 3D viewer when a model is loaded.
struct ViewerSettings
{
    float exposure{1.2f};
    std::string environmentImage{"neutral"};
    float environmentIntensity{1.0f};
    float shadowIntensity{0.3f};
    std::optional<std::string> cameraOrbit{};
    std::optional<std::string> fieldOfView{};
};

/// Static configuration for one device mockup.
/// Created at startup from the catalog and never mutated afterwards; the discovered
/// screen material name lives in ScreenMaterialBindings, not here.
struct MKS_EXPORT DeviceDescriptor
{
    std::string id{};
    std::string name{};

    /// Folder holding "<assetPrefix>_bg.png" and "<assetPrefix>_screenmask.png".
    std::filesystem::path folder{};
    std::string assetPrefix{};

    /// Vertical offset between background art and screen mask coordinate spaces.
    float chromeOffset{0.0f};
    /// Nominal screen resolution; used for 3D-only devices and the recommended upload size.
    std::uint32_t screenWidth{0};
    std::uint32_t screenHeight{0};
    bool has2DAssets{true};

    // ── 3D model ───────────────────────────────────────────────────────

    std::filesystem::path modelPath{};
    /// Known screen material name; seeds the binding cache.
    std::string screenMaterialName{};
    std::optional<TextureSlot> screenTextureSlot{};
    /// Atlas side length in pixels; 0 means "screen width".
    std::uint32_t screenTextureSize{0};
    std::optional<UvRect> screenTextureUV{};
    float screenTextureRotation{0.0f};
    float screenTextureScaleX{1.0f};
    float screenTextureScaleY{1.0f};
    float screenTextureTranslateX{0.0f};
    float screenTextureTranslateY{0.0f};
    float screenTextureTranslatePercentX{0.0f};
    float screenTextureTranslatePercentY{0.0f};
    /// Extra vertical pixel offset applied when fitting the image into the screen raster.
    float screenTextureOffset{0.0f};
    bool screenUnlit{false};
    std::optional<float> emissiveStrength{};
    std::vector<BodyMaterialTint> bodyMaterials{};

    // ── Viewer presentation ────────────────────────────────────────────

    std::optional<std::string> cameraOrbit{};
    std::optional<std::string> fieldOfView{};
    std::optional<std::string> environmentImage{};
    std::optional<float> exposure{};
    std::optional<float> environmentIntensity{};
    std::optional<float> shadowIntensity{};
    bool disableEnvironmentLighting{false};

    bool has_model() const noexcept
    {
        return !modelPath.empty();
    }
};

/// "<folder>/<assetPrefix>_bg.png"
MKS_EXPORT std::filesystem::path background_path(const DeviceDescriptor& device);

/// "<folder>/<assetPrefix>_screenmask.png"
MKS_EXPORT std::filesystem::path mask_path(const DeviceDescriptor& device);

/// Resolves viewer defaults; disabling environment lighting zeroes environment and shadow intensity.
MKS_EXPORT ViewerSettings resolve_viewer_settings(const DeviceDescriptor& device);

/// "Recommended: <w>px × <h>px", or an empty string when the nominal size is unknown.
MKS_EXPORT std::string recommended_resolution(const DeviceDescriptor& device);

MKS_RESTORE_DLL_WARNINGS
