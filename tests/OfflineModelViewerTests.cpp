#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <Assets/Private/ModelLoader.hpp>
#include <Materials/Public/MaterialMutator.hpp>
#include <Materials/Public/ScreenApplier.hpp>
#include <Materials/Public/ScreenMaterialBindings.hpp>
#include <Materials/Public/ScreenMaterialResolver.hpp>
#include <Viewer/Public/OfflineModelViewer.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string_view>

namespace
{
/// Two-triangle quad with one face per material.
std::filesystem::path write_test_model()
{
    const auto dir = std::filesystem::temp_directory_path() / "mockup_studio_tests" / "offline_viewer";
    std::filesystem::create_directories(dir);

    {
        std::ofstream mtl(dir / "device.mtl");
        mtl << "newmtl Screen_Display\n"
               "Kd 0.2 0.3 0.4\n"
               "d 1\n"
               "\n"
               "newmtl Body\n"
               "Kd 0.8 0.8 0.8\n"
               "d 0.5\n";
    }

    const auto objPath = dir / "device.obj";
    {
        std::ofstream obj(objPath);
        obj << "mtllib device.mtl\n"
               "v 0 0 0\n"
               "v 1 0 0\n"
               "v 0 1 0\n"
               "v 1 1 0\n"
               "usemtl Screen_Display\n"
               "f 1 2 3\n"
               "usemtl Body\n"
               "f 2 4 3\n";
    }
    return objPath;
}

IMaterialSurface* find_surface(IModelViewer& viewer, std::string_view name)
{
    for (IMaterialSurface* surface : viewer.materials())
    {
        if (surface->name() == name)
            return surface;
    }
    return nullptr;
}
} // namespace

TEST_CASE("Model loader reads the material table")
{
    auto model = ModelLoader::parse_model(write_test_model());
    REQUIRE(model.has_value());

    const ModelData& data = *model.value();
    REQUIRE(data.name == "device");
    REQUIRE(data.materials.size() == 2);
    const auto body = std::find_if(data.materials.begin(), data.materials.end(),
                                   [](const MaterialData& material) { return material.name == "Body"; });
    REQUIRE(body != data.materials.end());
    REQUIRE(body->alphaMode == AlphaMode::Blend);
}

TEST_CASE("Missing model files are reported")
{
    auto model = ModelLoader::parse_model("does/not/exist.obj");
    REQUIRE_FALSE(model.has_value());
    REQUIRE(model.error().code == ErrorCode::AssetFileNotFound);

    OfflineModelViewer viewer;
    auto loaded = viewer.load_model("does/not/exist.obj");
    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == ErrorCode::ModelNotLoaded);
    REQUIRE_FALSE(viewer.has_model());
    REQUIRE(viewer.model_count() == 0);
}

TEST_CASE("Loaded materials carry their MTL factors")
{
    OfflineModelViewer viewer;
    REQUIRE(viewer.load_model(write_test_model()).has_value());
    REQUIRE(viewer.has_model());
    REQUIRE(viewer.materials().size() == 2);

    const MaterialData* screen = viewer.material("Screen_Display");
    REQUIRE(screen != nullptr);
    REQUIRE(screen->baseColorFactor.x == Approx(0.2f));
    REQUIRE(screen->baseColorFactor.z == Approx(0.4f));
    REQUIRE(screen->alphaMode == AlphaMode::Opaque);

    const MaterialData* body = viewer.material("Body");
    REQUIRE(body != nullptr);
    REQUIRE(body->alphaMode == AlphaMode::Blend);
    REQUIRE(body->baseColorFactor.w == Approx(0.5f));
}

TEST_CASE("Reloading reuses the parsed model but resets the working materials")
{
    const auto path = write_test_model();
    OfflineModelViewer viewer;
    REQUIRE(viewer.load_model(path).has_value());

    const MaterialMutator mutator = MaterialMutator::for_viewer(viewer);
    const float loadedMetallic = viewer.material("Body")->metallic;
    IMaterialSurface* body = find_surface(viewer, "Body");
    REQUIRE(body != nullptr);
    REQUIRE(mutator.write_scalar(*body, ScalarProperty::MetallicFactor, 0.9f).value() ==
            MutationPath::DirectProperty);
    REQUIRE(viewer.material("Body")->metallic == 0.9f);

    REQUIRE(viewer.load_model(path).has_value());
    REQUIRE(viewer.model_count() == 1);
    REQUIRE(viewer.material("Body")->metallic == loadedMetallic);
}

TEST_CASE("Setter path refuses unknown texture handles")
{
    OfflineModelViewer viewer;
    REQUIRE(viewer.load_model(write_test_model()).has_value());
    IMaterialSurface* screen = find_surface(viewer, "Screen_Display");
    REQUIRE(screen != nullptr);

    const MaterialMutator mutator = MaterialMutator::for_viewer(viewer);
    auto written = mutator.write_texture(*screen, TextureSlot::BaseColor, TextureHandle{77});
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().code == ErrorCode::MutationUnsupported);

    auto handle = viewer.create_texture(make_solid(2, 2, 1, 2, 3));
    REQUIRE(handle.has_value());
    REQUIRE(mutator.write_texture(*screen, TextureSlot::BaseColor, *handle).value() == MutationPath::SetterMethod);
    REQUIRE(viewer.material("Screen_Display")->texture(TextureSlot::BaseColor) == *handle);
}

TEST_CASE("Texture creation can be disabled")
{
    OfflineModelViewer viewer(false);
    auto handle = viewer.create_texture(make_solid(2, 2, 1, 2, 3));
    REQUIRE_FALSE(handle.has_value());
    REQUIRE(handle.error().code == ErrorCode::TextureCreationUnavailable);

    OfflineModelViewer enabled;
    auto empty = enabled.create_texture(TextureData{});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == ErrorCode::InvalidRaster);
}

TEST_CASE("Screen applier paints through the offline viewer")
{
    OfflineModelViewer viewer;
    REQUIRE(viewer.load_model(write_test_model()).has_value());

    DeviceDescriptor device;
    device.id = "offline";
    device.name = "Offline";
    device.has2DAssets = false;
    device.screenWidth = 16;
    device.screenHeight = 16;
    device.screenTextureSlot = TextureSlot::Emissive;
    device.screenTextureSize = 64;
    device.screenTextureUV = UvRect{0.25f, 0.25f, 0.75f, 0.75f};
    device.screenUnlit = true;
    device.emissiveStrength = 0.3f;

    ScreenMaterialBindings bindings;
    ScreenMaterialResolver resolver(bindings);
    ScreenApplier applier(resolver);

    auto slots = applier.paint_screen_texture(viewer, device, nullptr, make_solid(8, 8, 200, 100, 50));
    REQUIRE(slots.has_value());
    REQUIRE(*slots == std::vector<TextureSlot>{TextureSlot::Emissive, TextureSlot::BaseColor});

    const MaterialData* screen = viewer.material("Screen_Display");
    REQUIRE(screen->unlit);
    REQUIRE(screen->metallic == 0.0f);
    REQUIRE(screen->roughness == 1.0f);
    REQUIRE(screen->emissiveStrength == 0.3f);
    REQUIRE(screen->baseColorFactor.x == 1.0f);

    const auto handle = screen->texture(TextureSlot::Emissive);
    REQUIRE(handle.has_value());
    const TextureData* atlas = viewer.texture(*handle);
    REQUIRE(atlas != nullptr);
    REQUIRE(atlas->width == 64);
    REQUIRE(pixel_is(*atlas, 0, 0, 0, 0, 0));
    REQUIRE(pixel_is(*atlas, 32, 32, 200, 100, 50));
    REQUIRE(viewer.render_requests() == 1);
}
