#pragma once
#include "../../Core/Public/Core.hpp"
#include "ScreenMaterialBindings.hpp"

#include <span>
#include <string_view>

class IMaterialSurface;
struct DeviceDescriptor;

MKS_SUPPRESS_DLL_WARNINGS

/// Locates the material that displays a device's screen.
///
/// A bound name (discovered earlier or seeded from the descriptor) that still exists in the
/// model wins outright. Otherwise every material is scored by name and the first strict
/// maximum is taken, so ties resolve to the earliest material. The winner is bound for reuse.
class MKS_EXPORT ScreenMaterialResolver
{
  public:
    explicit ScreenMaterialResolver(ScreenMaterialBindings& bindings) noexcept : m_bindings{bindings}
    {}

    /// Returns the screen material, or nullptr for an empty list.
    IMaterialSurface* resolve(const DeviceDescriptor& device, std::span<IMaterialSurface* const> materials);

    /// Name heuristic, case-insensitive:
    ///   +8 "screen" and "bg", else +6 "screen"; +4 "display"; +2 "panel"; -3 "glass".
    static int score(std::string_view materialName);

    ScreenMaterialBindings& bindings() noexcept
    {
        return m_bindings;
    }

  private:
    ScreenMaterialBindings& m_bindings;
};

MKS_RESTORE_DLL_WARNINGS
