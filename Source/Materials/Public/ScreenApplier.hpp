#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/MaterialData.hpp"
#include "../../Compositing/Public/ScreenTexturePainter.hpp"
#include "ScreenMaterialResolver.hpp"

#include <cstdint>
#include <optional>
#include <vector>

class IMaterialSurface;
class IModelViewer;
class MaterialMutator;
struct DeviceAssets;
struct DeviceDescriptor;
struct TextureData;

MKS_SUPPRESS_DLL_WARNINGS

/// Writes the screen material of a loaded device model: the painted user image, or a
/// neutral grey screen when there is no image.
class MKS_EXPORT ScreenApplier
{
  public:
    /// Fill of the placeholder screen texture (#3a3a3a).
    static constexpr Color kDefaultScreenColor{58.0f / 255.0f, 58.0f / 255.0f, 58.0f / 255.0f, 1.0f};
    static constexpr std::uint32_t kDefaultScreenSize{16};

    explicit ScreenApplier(ScreenMaterialResolver& resolver, ScreenTexturePainter painter = {}) noexcept
        : m_resolver{resolver}, m_painter{painter}
    {}

    /// Resets the screen material to a flat emissive baseline, paints the user image into the
    /// atlas and binds it to every candidate slot that accepts it.
    /// Returns the slots that received the texture; an empty list when the device has no
    /// screen dimensions. Fails with TextureApplicationExhausted when no slot accepts it.
    Result<std::vector<TextureSlot>> paint_screen_texture(IModelViewer& viewer, const DeviceDescriptor& device,
                                                          const DeviceAssets* assets, const TextureData& userImage);

    /// Binds a small grey texture to the first accepting candidate slot.
    /// Returns the slot used, or nullopt when nothing could be applied.
    Result<std::optional<TextureSlot>> set_default_screen(IModelViewer& viewer, const DeviceDescriptor& device);

  private:
    void reset_screen_material(const MaterialMutator& mutator, IMaterialSurface& material,
                               const DeviceDescriptor& device) const;

    ScreenMaterialResolver& m_resolver;
    ScreenTexturePainter m_painter;
};

MKS_RESTORE_DLL_WARNINGS
