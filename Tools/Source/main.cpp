#include <Assets/Private/TextureLoader.hpp>
#include <Assets/Public/AssetCache.hpp>
#include <Catalog/Public/DeviceCatalog.hpp>
#include <Compositing/Public/ScreenTexturePainter.hpp>
#include <Core/Public/Core.hpp>
#include <Materials/Public/MaterialMutator.hpp>
#include <Session/Public/MockupSession.hpp>
#include <Viewer/Public/OfflineModelViewer.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace
{
struct Options
{
    std::string deviceId{};
    std::filesystem::path imagePath{};
    std::filesystem::path outputPath{};
    std::optional<std::filesystem::path> catalogPath{};
    std::optional<std::filesystem::path> modelPath{};
    std::optional<std::filesystem::path> exportCatalogPath{};
    bool model{false};
    bool list{false};
};

void print_usage()
{
    fmt::print("MockupStudio {}\n"
               "Usage:\n"
               "  mockup_cli <device-id> <image> <output.png> [--3d] [--model file.obj] [--catalog file]\n"
               "  mockup_cli --list [--catalog file]\n"
               "  mockup_cli --export-catalog <file> [--catalog file]\n",
               static_cast<const char*>(MOCKUP_STUDIO));
}

Result<Options> parse_arguments(int argc, char** argv)
{
    Options options;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc)
                return std::nullopt;
            return std::string_view{argv[++i]};
        };

        if (arg == "--3d")
            options.model = true;
        else if (arg == "--list")
            options.list = true;
        else if (arg == "--catalog" || arg == "--model" || arg == "--export-catalog")
        {
            auto value = next();
            if (!value)
                return make_error(fmt::format("Missing value for {}", arg), ErrorCode::None);
            if (arg == "--catalog")
                options.catalogPath = std::filesystem::path{*value};
            else if (arg == "--model")
                options.modelPath = std::filesystem::path{*value};
            else
                options.exportCatalogPath = std::filesystem::path{*value};
        }
        else if (arg.starts_with("--"))
            return make_error(fmt::format("Unknown option: {}", arg), ErrorCode::None);
        else
            positional.push_back(arg);
    }

    if (options.list || options.exportCatalogPath)
        return options;

    if (positional.size() != 3)
        return make_error("Expected <device-id> <image> <output.png>", ErrorCode::None);

    options.deviceId = positional[0];
    options.imagePath = positional[1];
    options.outputPath = positional[2];
    return options;
}

Result<DeviceCatalog> open_catalog(const Options& options)
{
    if (options.catalogPath)
        return DeviceCatalog::load(*options.catalogPath);
    return DeviceCatalog::builtin();
}

void list_devices(const DeviceCatalog& catalog)
{
    for (const auto& device : catalog.devices())
    {
        std::string views = device.has2DAssets ? "2d" : "";
        if (device.has_model())
            views += views.empty() ? "3d" : ",3d";
        fmt::print("{:<20} {:<24} [{}] {}\n", device.id, device.name, views, recommended_resolution(device));
    }
}

/// Writes the texture bound to the screen material, falling back to painting the atlas directly
/// when no model could be loaded.
Result<> export_screen_texture(MockupSession& session, OfflineModelViewer& viewer, const std::filesystem::path& output)
{
    const DeviceDescriptor& device = *session.active_device();

    if (viewer.has_model())
    {
        const std::string* screenName = session.bindings().find(device.id);
        const MaterialData* material = screenName ? viewer.material(*screenName) : nullptr;
        if (!material)
            return make_error(fmt::format("No screen material bound for {}", device.name), ErrorCode::MaterialNotFound);

        for (const TextureSlot slot : MaterialMutator::candidate_slots(device.screenTextureSlot))
        {
            const auto& handle = material->texture(slot);
            if (!handle)
                continue;
            if (const TextureData* texture = viewer.texture(*handle))
                return TextureWriter::write_png(*texture, output);
        }
        return make_error(fmt::format("Screen material '{}' has no texture", material->name),
                          ErrorCode::TextureApplicationExhausted);
    }

    fmt::print(stderr, "mockup_cli: no model loaded, exporting the painted atlas only\n");
    ScreenTexturePainter painter;
    auto atlas = painter.paint(*session.user_image(), device, session.assets());
    if (!atlas)
        return make_error(atlas.error());
    return TextureWriter::write_png(atlas.value(), output);
}

Result<> run(const Options& options)
{
    auto catalog = open_catalog(options);
    if (!catalog)
        return make_error(catalog.error());

    if (options.list)
    {
        list_devices(catalog.value());
        return {};
    }

    if (options.exportCatalogPath)
    {
        auto saved = catalog->save(*options.exportCatalogPath);
        if (saved)
            fmt::print("Exported {} devices to {}\n", catalog->size(), options.exportCatalogPath->string());
        return saved;
    }

    if (options.modelPath)
    {
        const DeviceDescriptor* found = catalog->find(options.deviceId);
        if (!found)
            return make_error(fmt::format("Unknown device: {}", options.deviceId), ErrorCode::DeviceNotFound);
        DeviceDescriptor device = *found;
        device.modelPath = *options.modelPath;
        catalog->add(std::move(device));
    }

    auto image = TextureLoader::load_image(options.imagePath);
    if (!image)
        return make_error(image.error());

    AssetCache assetCache;
    OfflineModelViewer viewer;
    MockupSession session{catalog.value(), assetCache, options.model ? &viewer : nullptr};

    if (auto selected = session.select_device(options.deviceId); !selected)
        return selected;
    session.poll_assets(true);
    session.set_user_image(std::move(image.value()));

    if (options.model)
    {
        if (auto mode = session.set_view_mode(ViewMode::Model); !mode)
        {
            if (mode.error().code == ErrorCode::ViewModeUnavailable)
                return mode;
            fmt::print(stderr, "mockup_cli: {}\n", mode.error().message);
        }
        if (auto exported = export_screen_texture(session, viewer, options.outputPath); !exported)
            return exported;
        fmt::print("Wrote 3D screen texture to {}\n", options.outputPath.string());
        return {};
    }

    if (!session.can_export())
        return make_error(fmt::format("No 2D assets available for {}", session.active_device()->name),
                          ErrorCode::AssetFileNotFound);

    const TextureData mockup = session.render_flat();
    if (auto written = TextureWriter::write_png(mockup, options.outputPath); !written)
        return written;

    fmt::print("Wrote {}x{} mockup to {}\n", mockup.width, mockup.height, options.outputPath.string());
    return {};
}
} // namespace

int main(int argc, char** argv)
{
    auto options = parse_arguments(argc, argv);
    if (!options)
    {
        fmt::print(stderr, "{}\n", options.error().message);
        print_usage();
        return EXIT_FAILURE;
    }

    return get_error_code(run(options.value())) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
