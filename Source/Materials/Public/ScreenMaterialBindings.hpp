#pragma once
#include "../../Core/Public/Core.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

struct DeviceDescriptor;

MKS_SUPPRESS_DLL_WARNINGS

/// Device id -> discovered screen material name.
/// Lives outside the (immutable) device descriptors; entries persist until clear().
class MKS_EXPORT ScreenMaterialBindings
{
  public:
    /// Binds the descriptor's configured screenMaterialName unless the device is already bound.
    void seed(const DeviceDescriptor& device);

    /// Returns the bound material name, or nullptr.
    const std::string* find(std::string_view deviceId) const noexcept;

    void bind(std::string_view deviceId, std::string_view materialName);

    void clear() noexcept
    {
        m_names.clear();
    }

    size_t size() const noexcept
    {
        return m_names.size();
    }

  private:
    std::map<std::string, std::string, std::less<>> m_names;
};

MKS_RESTORE_DLL_WARNINGS
