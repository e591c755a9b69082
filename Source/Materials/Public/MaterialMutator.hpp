#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/MaterialData.hpp"
#include "../../Viewer/Public/MaterialSurface.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

class IModelViewer;

MKS_SUPPRESS_DLL_WARNINGS

/// The only writer of model materials.
///
/// Each write tries the configured mutation paths in order and stops at the first facet
/// that accepts it. Failures of individual paths are expected and dropped; only running out
/// of paths is reported. Successful writes return the path that took them.
class MKS_EXPORT MaterialMutator
{
  public:
    explicit MaterialMutator(std::vector<MutationPath> order = std::vector<MutationPath>(kDefaultMutationOrder.begin(),
                                                                                          kDefaultMutationOrder.end()));

    /// Mutator probing the paths the viewer declares, in its order.
    static MaterialMutator for_viewer(const IModelViewer& viewer);

    Result<MutationPath> write_texture(IMaterialSurface& material, TextureSlot slot, TextureHandle texture) const;
    Result<MutationPath> clear_texture(IMaterialSurface& material, TextureSlot slot) const;
    Result<MutationPath> write_color(IMaterialSurface& material, ColorProperty property, const Color& color) const;
    Result<MutationPath> write_scalar(IMaterialSurface& material, ScalarProperty property, float value) const;
    Result<MutationPath> write_alpha_mode(IMaterialSurface& material, AlphaMode mode) const;
    Result<MutationPath> write_unlit(IMaterialSurface& material, bool unlit) const;

    /// Slots to try for a screen texture: preferred (base color when unset), base color, emissive.
    static std::vector<TextureSlot> candidate_slots(std::optional<TextureSlot> preferred);

    std::span<const MutationPath> order() const noexcept
    {
        return m_order;
    }

  private:
    template <typename Write>
    Result<MutationPath> try_paths(IMaterialSurface& material, std::string_view what, Write&& write) const;

    std::vector<MutationPath> m_order;
};

MKS_RESTORE_DLL_WARNINGS
