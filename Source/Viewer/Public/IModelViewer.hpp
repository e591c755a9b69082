#pragma once
#include "../../Core/Public/Expected.hpp"
#include "../../Assets/Public/MaterialData.hpp"
#include "../../Catalog/Public/DeviceDescriptor.hpp"
#include "MaterialSurface.hpp"

#include <filesystem>
#include <span>
#include <vector>

struct TextureData;

MKS_SUPPRESS_DLL_WARNINGS

/// Abstract 3D model viewer. The display pipeline (camera, lighting, rasterization) lives
/// behind this surface; the core only loads models, writes materials and creates textures.
class MKS_EXPORT IModelViewer
{
  public:
    virtual ~IModelViewer() = default;

    /// Loads (or switches to) the model at the given path.
    virtual Result<> load_model(const std::filesystem::path& path) = 0;

    /// Path of the currently loaded model, empty when none.
    virtual const std::filesystem::path& model_path() const noexcept = 0;

    virtual bool has_model() const noexcept = 0;

    /// Materials of the loaded model in source order. Pointers stay valid until the next load_model().
    virtual std::vector<IMaterialSurface*> materials() = 0;

    /// Order in which MaterialMutator tries this viewer's mutation paths.
    virtual std::span<const MutationPath> mutation_paths() const noexcept
    {
        return kDefaultMutationOrder;
    }

    virtual bool supports_texture_creation() const noexcept = 0;

    /// Uploads a raster and returns a handle usable with IMaterialFacet::set_texture().
    virtual Result<TextureHandle> create_texture(const TextureData& raster) = 0;

    /// Asks the viewer to redraw after material changes.
    virtual void request_render() noexcept
    {}

    /// Applies exposure, environment, shadow and camera settings.
    virtual void apply_settings(const ViewerSettings& settings) = 0;
};

MKS_RESTORE_DLL_WARNINGS
