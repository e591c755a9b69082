#include "TextureLoader.hpp"

#include <fmt/core.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <filesystem>
#include <system_error>

TextureLoader::result_type TextureLoader::operator()(const std::filesystem::path& path) const
{
    auto result = load_image(path);
    if (!result)
    {
        fmt::print(stderr, "TextureLoader: failed to load '{}': {}\n", path.string(), result.error().message);
        return nullptr;
    }
    return std::move(result.value());
}

TextureLoader::result_type TextureLoader::operator()(const TextureData& data) const
{
    return std::make_shared<TextureData>(data);
}

Result<std::shared_ptr<TextureData>> TextureLoader::load_image(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    const std::string pathStr = path.string();
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec)
    {
        return make_error(fmt::format("Cannot access texture file '{}': {}", pathStr, ec.message()),
                          ErrorCode::FileReadFailed);
    }
    if (!exists)
    {
        return make_error(fmt::format("Texture file not found: {}", pathStr), ErrorCode::AssetFileNotFound);
    }

    int width = 0;
    int height = 0;
    int channelsInFile = 0;
    constexpr int desiredChannels = TextureData::kChannels; // Force RGBA

    stbi_uc* pixels = stbi_load(pathStr.c_str(), &width, &height, &channelsInFile, desiredChannels);
    if (!pixels)
    {
        return make_error(fmt::format("stb_image failed to load '{}': {}", pathStr, stbi_failure_reason()),
                          ErrorCode::AssetParsingFailed);
    }

    const size_t imageSize = static_cast<size_t>(width) * static_cast<size_t>(height) * desiredChannels;

    auto texture = std::make_shared<TextureData>();
    texture->name = path.stem().string();
    texture->sourcePath = path;
    texture->width = static_cast<uint32_t>(width);
    texture->height = static_cast<uint32_t>(height);
    texture->channels = desiredChannels;
    texture->pixels.assign(pixels, pixels + imageSize);

    stbi_image_free(pixels);

    return texture;
}

Result<> TextureWriter::write_png(const TextureData& texture, const std::filesystem::path& path)
{
    if (texture.empty())
        return make_error(fmt::format("Refusing to write empty raster '{}'", texture.name), ErrorCode::InvalidRaster);

    const int width = static_cast<int>(texture.width);
    const int height = static_cast<int>(texture.height);
    const int stride = width * static_cast<int>(TextureData::kChannels);

    if (!stbi_write_png(path.string().c_str(), width, height, TextureData::kChannels, texture.pixels.data(), stride))
        return make_error(fmt::format("stb_image_write failed to write '{}'", path.string()), ErrorCode::FileWriteFailed);

    return {};
}
