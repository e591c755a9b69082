#include "../Public/DeviceDescriptor.hpp"

#include <fmt/core.h>

std::filesystem::path background_path(const DeviceDescriptor& device)
{
    return device.folder / fmt::format("{}_bg.png", device.assetPrefix);
}

std::filesystem::path mask_path(const DeviceDescriptor& device)
{
    return device.folder / fmt::format("{}_screenmask.png", device.assetPrefix);
}

ViewerSettings resolve_viewer_settings(const DeviceDescriptor& device)
{
    ViewerSettings settings;
    settings.exposure = device.exposure.value_or(1.2f);
    settings.environmentImage = device.environmentImage.value_or("neutral");
    settings.environmentIntensity =
        device.disableEnvironmentLighting ? 0.0f : device.environmentIntensity.value_or(1.0f);
    settings.shadowIntensity = device.disableEnvironmentLighting ? 0.0f : device.shadowIntensity.value_or(0.3f);
    settings.cameraOrbit = device.cameraOrbit;
    settings.fieldOfView = device.fieldOfView;
    return settings;
}

std::string recommended_resolution(const DeviceDescriptor& device)
{
    if (device.screenWidth == 0 || device.screenHeight == 0)
        return {};
    return fmt::format("Recommended: {}px × {}px", device.screenWidth, device.screenHeight);
}
