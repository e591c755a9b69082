#pragma once
#include "../../Core/Public/Core.hpp"
#include "MaterialData.hpp"

#include <filesystem>
#include <string>
#include <vector>

MKS_SUPPRESS_DLL_WARNINGS

/// CPU-side model data as seen by the material pipeline.
/// Produced by loading an OBJ+MTL file; geometry stays with the external renderer.
struct MKS_EXPORT ModelData
{
    /// Human-readable model identifier, usually derived from source filename.
    std::string name{};
    /// Original model source path used to build this asset.
    std::filesystem::path sourcePath{};

    /// Material entries in source order.
    std::vector<MaterialData> materials{};
};

MKS_RESTORE_DLL_WARNINGS
