#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Assets/Private/TextureLoader.hpp>
#include <Session/Public/RequestFence.hpp>

#include <filesystem>
#include <string>

TEST_CASE("PNG export decodes back to the same pixels")
{
    const auto dir = std::filesystem::temp_directory_path() / "mockup_studio_tests" / "texture_io";
    std::filesystem::create_directories(dir);
    const auto file = dir / "mockup.png";

    TextureData raster = make_solid(3, 2, 10, 20, 30);
    raster.pixel(2, 1)[3] = 0;
    REQUIRE(TextureWriter::write_png(raster, file).has_value());

    auto decoded = TextureLoader::load_image(file);
    REQUIRE(decoded.has_value());
    REQUIRE((*decoded)->width == 3);
    REQUIRE((*decoded)->height == 2);
    REQUIRE((*decoded)->name == "mockup");
    REQUIRE(pixel_is(**decoded, 0, 0, 10, 20, 30));
    REQUIRE((*decoded)->pixel(2, 1)[3] == 0);
}

TEST_CASE("Image loading reports missing and undecodable files")
{
    auto missing = TextureLoader::load_image("does/not/exist.png");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::AssetFileNotFound);

    REQUIRE(TextureWriter::write_png(TextureData{}, "unused.png").error().code == ErrorCode::InvalidRaster);
}

TEST_CASE("Unreachable image paths are reported instead of thrown")
{
    const auto path = std::filesystem::temp_directory_path() / (std::string(5000, 'x') + ".png");

    Result<std::shared_ptr<TextureData>> loaded = make_error("not attempted", ErrorCode::None);
    REQUIRE_NOTHROW(loaded = TextureLoader::load_image(path));
    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == ErrorCode::FileReadFailed);
}

TEST_CASE("Request fence only honours the latest ticket")
{
    RequestFence fence;
    const auto first = fence.advance();
    const auto second = fence.advance();

    REQUIRE_FALSE(fence.is_current(first));
    REQUIRE(fence.is_current(second));
    REQUIRE(fence.current() == second);
}
