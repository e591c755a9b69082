#pragma once
#include "../../Core/Public/Core.hpp"
#include "../../Core/Public/Expected.hpp"
#include "../Public/ModelData.hpp"

#include <filesystem>
#include <memory>

/// Loads a model's material table (OBJ + MTL) into ModelData.
/// Material factors come from the MTL library; the OBJ must hold at least one shape.
///
/// Conforms to the EnTT resource_cache loader concept:
///   operator()(args...) -> shared_ptr<ModelData>
struct MKS_EXPORT ModelLoader
{
    using result_type = std::shared_ptr<ModelData>;

    /// Load a model from the given file path.
    /// Returns nullptr on failure (EnTT cache convention).
    result_type operator()(const std::filesystem::path& path) const;

    /// Load with full error reporting.
    static Result<std::shared_ptr<ModelData>> parse_model(const std::filesystem::path& path);
};
