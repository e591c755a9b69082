#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "DeviceDescriptor.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

MKS_SUPPRESS_DLL_WARNINGS

/// Ordered table of device descriptors.
/// Ships with a built-in library and can be persisted as a .mks_catalog FlatBuffers binary.
class MKS_EXPORT DeviceCatalog
{
  public:
    DeviceCatalog() = default;

    // ── Factories ──────────────────────────────────────────────────────

    /// Returns the built-in device library.
    static DeviceCatalog builtin();

    /// Loads a catalog from a .mks_catalog file.
    static Result<DeviceCatalog> load(const std::filesystem::path& filePath);

    // ── Persistence ────────────────────────────────────────────────────

    /// Saves the catalog to the given .mks_catalog file.
    Result<> save(const std::filesystem::path& filePath) const;

    // ── Device management ──────────────────────────────────────────────

    /// Adds a device, replacing any existing entry with the same id (order is kept).
    void add(DeviceDescriptor device);

    /// Returns the device with the given id, or nullptr.
    const DeviceDescriptor* find(std::string_view id) const noexcept;

    const std::vector<DeviceDescriptor>& devices() const noexcept
    {
        return m_devices;
    }

    size_t size() const noexcept
    {
        return m_devices.size();
    }

  private:
    std::vector<DeviceDescriptor> m_devices;
};

MKS_RESTORE_DLL_WARNINGS
