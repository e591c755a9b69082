#include "../Public/ScreenMaterialBindings.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"

void ScreenMaterialBindings::seed(const DeviceDescriptor& device)
{
    if (device.screenMaterialName.empty() || find(device.id))
        return;
    m_names.emplace(device.id, device.screenMaterialName);
}

const std::string* ScreenMaterialBindings::find(std::string_view deviceId) const noexcept
{
    auto it = m_names.find(deviceId);
    return it != m_names.end() ? &it->second : nullptr;
}

void ScreenMaterialBindings::bind(std::string_view deviceId, std::string_view materialName)
{
    auto it = m_names.find(deviceId);
    if (it != m_names.end())
    {
        it->second = materialName;
        return;
    }
    m_names.emplace(std::string(deviceId), std::string(materialName));
}
