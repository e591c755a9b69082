#include "ModelLoader.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include <rapidobj/rapidobj.hpp>

ModelLoader::result_type ModelLoader::operator()(const std::filesystem::path& path) const
{
    auto result = parse_model(path);
    if (!result)
    {
        fmt::print(stderr, "ModelLoader: failed to load '{}': {}\n", path.string(), result.error().message);
        return nullptr;
    }
    return std::move(result.value());
}

Result<std::shared_ptr<ModelData>> ModelLoader::parse_model(const std::filesystem::path& path)
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
        return make_error(fmt::format("Cannot access model file '{}': {}", path.string(), ec.message()),
                          ErrorCode::FileReadFailed);
    if (!exists)
        return make_error(fmt::format("Model file not found: {}", path.string()), ErrorCode::AssetFileNotFound);

    rapidobj::Result result =
        rapidobj::ParseFile(path, rapidobj::MaterialLibrary::Default(rapidobj::Load::Optional));
    if (result.error)
        return make_error(result.error.code.message(), ErrorCode::AssetParsingFailed);

    if (result.shapes.empty())
        return make_error("Model has no valid geometry", ErrorCode::AssetInvalidData);

    auto model = std::make_shared<ModelData>();
    model->name = path.stem().string();
    model->sourcePath = path;

    for (const auto& mat : result.materials)
    {
        MaterialData matData;
        matData.name = mat.name;
        matData.baseColorFactor = {mat.diffuse[0], mat.diffuse[1], mat.diffuse[2], mat.dissolve};
        matData.emissiveFactor = {mat.emission[0], mat.emission[1], mat.emission[2]};
        matData.roughness = mat.roughness;
        matData.metallic = mat.metallic;
        matData.clearcoat = mat.clearcoat_thickness;
        matData.clearcoatRoughness = mat.clearcoat_roughness;
        if (mat.dissolve < 1.0f)
            matData.alphaMode = AlphaMode::Blend;

        model->materials.push_back(std::move(matData));
    }

    if (model->materials.empty())
    {
        MaterialData defaultMat;
        defaultMat.name = "default";
        model->materials.push_back(std::move(defaultMat));
    }

    fmt::print("Loaded model '{}': {} materials\n", model->name, model->materials.size());

    return model;
}
