#pragma once
#include "../../Core/Public/Core.hpp"

#include <cstddef>

class IMaterialSurface;
class IModelViewer;
class MaterialMutator;
class SolidTextureCache;
struct BodyMaterialTint;
struct DeviceDescriptor;

MKS_SUPPRESS_DLL_WARNINGS

/// Recolors (or hides) the non-screen materials listed in a device's body tints.
class MKS_EXPORT BodyTint
{
  public:
    explicit BodyTint(SolidTextureCache& solidTextures) noexcept : m_solidTextures{solidTextures}
    {}

    /// Applies every tint whose material exists in the loaded model (names match
    /// case-insensitively; missing ones are logged and skipped).
    /// Returns the number of materials changed.
    size_t apply(IModelViewer& viewer, const DeviceDescriptor& device);

  private:
    void hide(const MaterialMutator& mutator, IMaterialSurface& material) const;
    void tint(IModelViewer& viewer, const MaterialMutator& mutator, IMaterialSurface& material,
              const BodyMaterialTint& descriptor);

    SolidTextureCache& m_solidTextures;
};

MKS_RESTORE_DLL_WARNINGS
