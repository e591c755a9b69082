#include "../Public/DeviceCatalog.hpp"
#include "../../Core/Public/Utils.hpp"

#include <DeviceCatalog_generated.h>

#include <flatbuffers/flatbuffers.h>
#include <fmt/core.h>

#include <algorithm>
#include <cstdint>

namespace fb = flatbuffers;
namespace fbc = MockupStudio::Catalog;

namespace
{
constexpr std::uint32_t kCatalogVersion{1};
constexpr float kPi{3.14159265358979323846f};

BodyMaterialTint tint(std::string name, Color color, float metallic, float roughness)
{
    BodyMaterialTint entry;
    entry.name = std::move(name);
    entry.color = color;
    entry.metallicFactor = metallic;
    entry.roughnessFactor = roughness;
    return entry;
}

BodyMaterialTint hidden(std::string name)
{
    BodyMaterialTint entry = tint(std::move(name), Color{0.0f, 0.0f, 0.0f, 0.0f}, 0.0f, 0.0f);
    entry.hide = true;
    return entry;
}

fb::Offset<fb::String> optional_string(fb::FlatBufferBuilder& fbb, const std::string& value)
{
    return value.empty() ? fb::Offset<fb::String>{} : fbb.CreateString(value);
}

fb::Offset<fb::String> optional_string(fb::FlatBufferBuilder& fbb, const std::optional<std::string>& value)
{
    return value ? fbb.CreateString(*value) : fb::Offset<fb::String>{};
}

std::string read_string(const fb::String* value)
{
    return value ? value->str() : std::string{};
}

std::optional<std::string> read_optional_string(const fb::String* value)
{
    if (!value)
        return std::nullopt;
    return value->str();
}

std::optional<float> read_optional(fb::Optional<float> value)
{
    if (!value.has_value())
        return std::nullopt;
    return value.value();
}

fb::Offset<fbc::DeviceEntry> serialize_device(fb::FlatBufferBuilder& fbb, const DeviceDescriptor& device)
{
    std::vector<fb::Offset<fbc::BodyMaterialEntry>> tintOffsets;
    tintOffsets.reserve(device.bodyMaterials.size());
    for (const auto& tint : device.bodyMaterials)
    {
        const auto nameOffset = fbb.CreateString(tint.name);
        const fbc::RgbaColor color(tint.color.r(), tint.color.g(), tint.color.b(), tint.color.a());

        fbc::BodyMaterialEntryBuilder builder(fbb);
        builder.add_name(nameOffset);
        builder.add_color(&color);
        if (tint.metallicFactor)
            builder.add_metallic_factor(*tint.metallicFactor);
        if (tint.roughnessFactor)
            builder.add_roughness_factor(*tint.roughnessFactor);
        if (tint.emissiveFactor)
        {
            const fbc::Vec3 emissive(tint.emissiveFactor->x, tint.emissiveFactor->y, tint.emissiveFactor->z);
            builder.add_emissive_factor(&emissive);
        }
        builder.add_hide(tint.hide);
        tintOffsets.push_back(builder.Finish());
    }

    const auto idOffset = fbb.CreateString(device.id);
    const auto nameOffset = fbb.CreateString(device.name);
    const auto folderOffset = fbb.CreateString(device.folder.generic_string());
    const auto prefixOffset = fbb.CreateString(device.assetPrefix);
    const auto modelOffset = optional_string(fbb, device.modelPath.generic_string());
    const auto materialOffset = optional_string(fbb, device.screenMaterialName);
    const auto slotOffset = device.screenTextureSlot
                                ? fbb.CreateString(std::string(to_string(*device.screenTextureSlot)))
                                : fb::Offset<fb::String>{};
    const auto tintsOffset = fbb.CreateVector(tintOffsets);
    const auto orbitOffset = optional_string(fbb, device.cameraOrbit);
    const auto fovOffset = optional_string(fbb, device.fieldOfView);
    const auto environmentOffset = optional_string(fbb, device.environmentImage);

    fbc::DeviceEntryBuilder builder(fbb);
    builder.add_id(idOffset);
    builder.add_name(nameOffset);
    builder.add_folder(folderOffset);
    builder.add_asset_prefix(prefixOffset);
    builder.add_chrome_offset(device.chromeOffset);
    builder.add_screen_width(device.screenWidth);
    builder.add_screen_height(device.screenHeight);
    builder.add_has_2d_assets(device.has2DAssets);
    if (!modelOffset.IsNull())
        builder.add_model_path(modelOffset);
    if (!materialOffset.IsNull())
        builder.add_screen_material_name(materialOffset);
    if (!slotOffset.IsNull())
        builder.add_screen_texture_slot(slotOffset);
    builder.add_screen_texture_size(device.screenTextureSize);
    if (device.screenTextureUV)
    {
        const auto& uv = *device.screenTextureUV;
        const fbc::UvRect rect(uv.uMin, uv.vMin, uv.uMax, uv.vMax);
        builder.add_screen_texture_uv(&rect);
    }
    builder.add_screen_texture_rotation(device.screenTextureRotation);
    builder.add_screen_texture_scale_x(device.screenTextureScaleX);
    builder.add_screen_texture_scale_y(device.screenTextureScaleY);
    builder.add_screen_texture_translate_x(device.screenTextureTranslateX);
    builder.add_screen_texture_translate_y(device.screenTextureTranslateY);
    builder.add_screen_texture_translate_percent_x(device.screenTextureTranslatePercentX);
    builder.add_screen_texture_translate_percent_y(device.screenTextureTranslatePercentY);
    builder.add_screen_texture_offset(device.screenTextureOffset);
    builder.add_screen_unlit(device.screenUnlit);
    if (device.emissiveStrength)
        builder.add_emissive_strength(*device.emissiveStrength);
    builder.add_body_materials(tintsOffset);
    if (!orbitOffset.IsNull())
        builder.add_camera_orbit(orbitOffset);
    if (!fovOffset.IsNull())
        builder.add_field_of_view(fovOffset);
    if (!environmentOffset.IsNull())
        builder.add_environment_image(environmentOffset);
    if (device.exposure)
        builder.add_exposure(*device.exposure);
    if (device.environmentIntensity)
        builder.add_environment_intensity(*device.environmentIntensity);
    if (device.shadowIntensity)
        builder.add_shadow_intensity(*device.shadowIntensity);
    builder.add_disable_environment_lighting(device.disableEnvironmentLighting);
    return builder.Finish();
}

DeviceDescriptor deserialize_device(const fbc::DeviceEntry& entry)
{
    DeviceDescriptor device;
    device.id = read_string(entry.id());
    device.name = read_string(entry.name());
    device.folder = read_string(entry.folder());
    device.assetPrefix = read_string(entry.asset_prefix());
    device.chromeOffset = entry.chrome_offset();
    device.screenWidth = entry.screen_width();
    device.screenHeight = entry.screen_height();
    device.has2DAssets = entry.has_2d_assets();

    device.modelPath = read_string(entry.model_path());
    device.screenMaterialName = read_string(entry.screen_material_name());
    if (const auto* slot = entry.screen_texture_slot())
        device.screenTextureSlot = texture_slot_from_string(slot->str());
    device.screenTextureSize = entry.screen_texture_size();
    if (const auto* uv = entry.screen_texture_uv())
        device.screenTextureUV = UvRect{uv->u_min(), uv->v_min(), uv->u_max(), uv->v_max()};
    device.screenTextureRotation = entry.screen_texture_rotation();
    device.screenTextureScaleX = entry.screen_texture_scale_x();
    device.screenTextureScaleY = entry.screen_texture_scale_y();
    device.screenTextureTranslateX = entry.screen_texture_translate_x();
    device.screenTextureTranslateY = entry.screen_texture_translate_y();
    device.screenTextureTranslatePercentX = entry.screen_texture_translate_percent_x();
    device.screenTextureTranslatePercentY = entry.screen_texture_translate_percent_y();
    device.screenTextureOffset = entry.screen_texture_offset();
    device.screenUnlit = entry.screen_unlit();
    device.emissiveStrength = read_optional(entry.emissive_strength());

    if (const auto* tints = entry.body_materials())
    {
        device.bodyMaterials.reserve(tints->size());
        for (const auto* tintEntry : *tints)
        {
            BodyMaterialTint tint;
            tint.name = read_string(tintEntry->name());
            if (const auto* c = tintEntry->color())
                tint.color = Color{c->r(), c->g(), c->b(), c->a()};
            tint.metallicFactor = read_optional(tintEntry->metallic_factor());
            tint.roughnessFactor = read_optional(tintEntry->roughness_factor());
            if (const auto* e = tintEntry->emissive_factor())
                tint.emissiveFactor = DirectX::XMFLOAT3{e->x(), e->y(), e->z()};
            tint.hide = tintEntry->hide();
            device.bodyMaterials.push_back(std::move(tint));
        }
    }

    device.cameraOrbit = read_optional_string(entry.camera_orbit());
    device.fieldOfView = read_optional_string(entry.field_of_view());
    device.environmentImage = read_optional_string(entry.environment_image());
    device.exposure = read_optional(entry.exposure());
    device.environmentIntensity = read_optional(entry.environment_intensity());
    device.shadowIntensity = read_optional(entry.shadow_intensity());
    device.disableEnvironmentLighting = entry.disable_environment_lighting();
    return device;
}
} // namespace

// ── Factories ────────────────────────────────────────────────────────

DeviceCatalog DeviceCatalog::builtin()
{
    DeviceCatalog catalog;

    {
        DeviceDescriptor device;
        device.id = "iphone-17-pro";
        device.name = "iPhone 17 Pro";
        device.folder = "devices/iPhone 17 Pro ";
        device.assetPrefix = "iphone-17-pro";
        device.chromeOffset = 253.0f;
        device.screenWidth = 402;
        device.screenHeight = 874;
        device.modelPath = "devices/iPhone 17 Pro /iphone-17-pro/source/iphone 17_4.glb";
        device.screenTextureSlot = TextureSlot::Emissive;
        device.screenTextureSize = 2048;
        device.screenTextureUV = UvRect{0.184886f, 0.438856f, 0.524024f, 0.601318f};
        device.screenTextureRotation = -kPi / 2.0f;
        device.screenTextureScaleX = 0.90f;
        device.screenTextureScaleY = -1.02f;
        device.screenTextureTranslateY = 80.0f;
        device.screenTextureOffset = 100.0f;
        device.bodyMaterials = {
            tint("Plastic", {0.343f, 0.360f, 0.427f, 1.0f}, 0.3f, 0.75f),
            tint("Screen_Rim", {0.326f, 0.343f, 0.410f, 1.0f}, 0.25f, 0.8f),
            tint("Material.004", {0.335f, 0.352f, 0.419f, 1.0f}, 0.25f, 0.75f),
            tint("Material.002", {0.326f, 0.343f, 0.410f, 1.0f}, 0.2f, 0.7f),
            tint("Rim_Buttons", {0.335f, 0.352f, 0.419f, 1.0f}, 0.3f, 0.7f),
            tint("Material.001", {0.343f, 0.360f, 0.427f, 1.0f}, 0.25f, 0.75f),
            tint("Material.003", {0.335f, 0.352f, 0.419f, 1.0f}, 0.25f, 0.75f),
        };
        catalog.add(std::move(device));
    }

    {
        DeviceDescriptor device;
        device.id = "macbook-pro-m3-16";
        device.name = "MacBook Pro 16\" (M3)";
        device.folder = "devices/MacBook Pro M3 16\"";
        device.assetPrefix = "macbook-pro-m3-16";
        device.screenWidth = 3456;
        device.screenHeight = 2234;
        device.has2DAssets = false;
        device.modelPath = "devices/MacBook Pro M3 16\"/3d/macbook_pro_m3_16_inch_2024.glb";
        device.screenMaterialName = "sfCQkHOWyrsLmor";
        device.screenTextureSlot = TextureSlot::Emissive;
        device.screenTextureSize = 2048;
        device.screenTextureUV = UvRect{0.006531f, 0.006531f, 0.993469f, 0.993509f};
        device.screenTextureScaleX = 1.0f;
        device.screenTextureScaleY = -1.0f;
        device.screenTextureTranslateY = 10.0f;
        device.cameraOrbit = "0deg 75deg 105%";
        device.fieldOfView = "30deg";
        device.exposure = 0.5f;
        device.screenUnlit = true;
        device.disableEnvironmentLighting = true;
        device.emissiveStrength = 0.3f;
        device.bodyMaterials = {hidden("jwuTsnFxKtBUxpK"), hidden("fNHiBfcxHUJCahl"), hidden("ZCDwChwkbBfITSW")};
        catalog.add(std::move(device));
    }

    {
        DeviceDescriptor device;
        device.id = "ipad-a16";
        device.name = "iPad A16";
        device.folder = "devices/iPad";
        device.assetPrefix = "ipad-a16";
        device.screenWidth = 768;
        device.screenHeight = 1024;
        catalog.add(std::move(device));
    }

    {
        DeviceDescriptor device;
        device.id = "imac-24";
        device.name = "iMac 24\"";
        device.folder = "devices/iMac";
        device.assetPrefix = "imac";
        device.screenWidth = 2048;
        device.screenHeight = 1152;
        device.has2DAssets = false;
        device.modelPath = "devices/iMac/3d/imac_2021.glb";
        device.screenMaterialName = "Screen";
        device.screenTextureSlot = TextureSlot::Emissive;
        device.screenTextureSize = 2048;
        device.screenTextureUV = UvRect{0.0f, 0.0f, 1.0f, 1.0f};
        device.screenTextureScaleX = 1.0f;
        device.screenTextureScaleY = -0.56f;
        device.screenTextureOffset = -10.0f;
        device.screenTextureTranslateY = 25.0f;
        device.exposure = 0.5f;
        device.screenUnlit = true;
        device.disableEnvironmentLighting = true;
        device.emissiveStrength = 0.3f;
        device.bodyMaterials = {
            tint("LightBlue", {0.85f, 0.85f, 0.86f, 1.0f}, 0.6f, 0.4f),
            tint("DarkBlue", {0.72f, 0.72f, 0.73f, 1.0f}, 0.55f, 0.45f),
            tint("Metal", {0.78f, 0.78f, 0.79f, 1.0f}, 0.65f, 0.35f),
            tint("Metal2", {0.78f, 0.78f, 0.79f, 1.0f}, 0.65f, 0.35f),
            tint("Black", {0.72f, 0.72f, 0.73f, 1.0f}, 0.5f, 0.5f),
            tint("Black.001", {0.72f, 0.72f, 0.73f, 1.0f}, 0.5f, 0.5f),
            tint("White", {0.22f, 0.22f, 0.23f, 1.0f}, 0.4f, 0.5f),
        };
        catalog.add(std::move(device));
    }

    return catalog;
}

Result<DeviceCatalog> DeviceCatalog::load(const std::filesystem::path& filePath)
{
    auto bytes = read_file(filePath);
    if (!bytes)
        return make_error(bytes.error());

    const auto& buffer = bytes.value();
    if (buffer.empty())
        return make_error(fmt::format("Catalog file is empty: {}", filePath.string()), ErrorCode::CatalogInvalid);

    const auto* data = reinterpret_cast<const uint8_t*>(buffer.data());
    fb::Verifier verifier(data, buffer.size());
    if (!fbc::VerifyDeviceCatalogAssetBuffer(verifier))
        return make_error(fmt::format("Invalid or corrupted catalog file: {}", filePath.string()),
                          ErrorCode::CatalogInvalid);

    const auto* asset = fbc::GetDeviceCatalogAsset(data);
    if (!asset)
        return make_error("Failed to parse catalog asset", ErrorCode::CatalogInvalid);

    DeviceCatalog catalog;
    if (const auto* devices = asset->devices())
    {
        for (const auto* entry : *devices)
        {
            DeviceDescriptor device = deserialize_device(*entry);
            if (device.id.empty())
            {
                fmt::print(stderr, "DeviceCatalog: skipping entry without id in '{}'\n", filePath.string());
                continue;
            }
            catalog.add(std::move(device));
        }
    }

    fmt::print("Loaded device catalog '{}': {} devices\n", filePath.string(), catalog.size());
    return catalog;
}

// ── Persistence ──────────────────────────────────────────────────────

Result<> DeviceCatalog::save(const std::filesystem::path& filePath) const
{
    fb::FlatBufferBuilder fbb(4096);

    std::vector<fb::Offset<fbc::DeviceEntry>> deviceOffsets;
    deviceOffsets.reserve(m_devices.size());
    for (const auto& device : m_devices)
    {
        deviceOffsets.push_back(serialize_device(fbb, device));
    }

    auto asset = fbc::CreateDeviceCatalogAsset(fbb, kCatalogVersion, fbb.CreateVector(deviceOffsets));
    fbc::FinishDeviceCatalogAssetBuffer(fbb, asset);

    return write_file(filePath, fbb.GetBufferPointer(), fbb.GetSize());
}

// ── Device management ────────────────────────────────────────────────

void DeviceCatalog::add(DeviceDescriptor device)
{
    auto it = std::find_if(m_devices.begin(), m_devices.end(),
                           [&](const DeviceDescriptor& existing) { return existing.id == device.id; });
    if (it != m_devices.end())
    {
        *it = std::move(device);
        return;
    }
    m_devices.push_back(std::move(device));
}

const DeviceDescriptor* DeviceCatalog::find(std::string_view id) const noexcept
{
    auto it = std::find_if(m_devices.begin(), m_devices.end(),
                           [&](const DeviceDescriptor& device) { return device.id == id; });
    return it != m_devices.end() ? &*it : nullptr;
}
