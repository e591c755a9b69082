#include "../Public/Canvas.hpp"
#include "../../Assets/Public/Color.hpp"
#include "../../Assets/Public/TextureData.hpp"

#include <algorithm>
#include <cmath>

using namespace DirectX;

namespace
{
/// Premultiplied color, components in [0, 1].
struct Premultiplied
{
    float r{};
    float g{};
    float b{};
    float a{};
};

Premultiplied load_pixel(const TextureData& image, std::uint32_t x, std::uint32_t y) noexcept
{
    const uint8_t* p = image.pixel(x, y);
    const float a = p[3] / 255.0f;
    return {p[0] / 255.0f * a, p[1] / 255.0f * a, p[2] / 255.0f * a, a};
}

void store_pixel(uint8_t* p, const Premultiplied& c) noexcept
{
    if (c.a <= 0.0f)
    {
        p[0] = p[1] = p[2] = p[3] = 0;
        return;
    }

    auto quantize = [](float v) { return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };
    p[0] = quantize(c.r / c.a);
    p[1] = quantize(c.g / c.a);
    p[2] = quantize(c.b / c.a);
    p[3] = quantize(c.a);
}

// Texel centers sit at half-integer coordinates; edges clamp.
Premultiplied sample_bilinear(const TextureData& image, double u, double v) noexcept
{
    const double fx = u - 0.5;
    const double fy = v - 0.5;
    const double floorX = std::floor(fx);
    const double floorY = std::floor(fy);
    const float tx = static_cast<float>(fx - floorX);
    const float ty = static_cast<float>(fy - floorY);

    const double maxX = static_cast<double>(image.width - 1);
    const double maxY = static_cast<double>(image.height - 1);
    const auto x0 = static_cast<std::uint32_t>(std::clamp(floorX, 0.0, maxX));
    const auto y0 = static_cast<std::uint32_t>(std::clamp(floorY, 0.0, maxY));
    const auto x1 = static_cast<std::uint32_t>(std::clamp(floorX + 1.0, 0.0, maxX));
    const auto y1 = static_cast<std::uint32_t>(std::clamp(floorY + 1.0, 0.0, maxY));

    const Premultiplied c00 = load_pixel(image, x0, y0);
    const Premultiplied c10 = load_pixel(image, x1, y0);
    const Premultiplied c01 = load_pixel(image, x0, y1);
    const Premultiplied c11 = load_pixel(image, x1, y1);

    auto lerp = [](float a, float b, float t) { return a + (b - a) * t; };
    auto mix = [&](float v00, float v10, float v01, float v11) {
        return lerp(lerp(v00, v10, tx), lerp(v01, v11, tx), ty);
    };

    return {mix(c00.r, c10.r, c01.r, c11.r), mix(c00.g, c10.g, c01.g, c11.g), mix(c00.b, c10.b, c01.b, c11.b),
            mix(c00.a, c10.a, c01.a, c11.a)};
}

Premultiplied composite(const Premultiplied& src, const Premultiplied& dst, CompositeOperation op) noexcept
{
    switch (op)
    {
    case CompositeOperation::SourceOver: {
        const float inv = 1.0f - src.a;
        return {src.r + dst.r * inv, src.g + dst.g * inv, src.b + dst.b * inv, src.a + dst.a * inv};
    }
    case CompositeOperation::SourceIn:
        return {src.r * dst.a, src.g * dst.a, src.b * dst.a, src.a * dst.a};
    case CompositeOperation::Copy:
        return src;
    }
    return src;
}

/// 2D part of a row-vector affine matrix: x' = x*m11 + y*m21 + tx, y' = x*m12 + y*m22 + ty.
struct Affine2D
{
    double m11{1.0};
    double m12{0.0};
    double m21{0.0};
    double m22{1.0};
    double tx{0.0};
    double ty{0.0};

    static Affine2D from(const XMFLOAT4X4& m) noexcept
    {
        return {m._11, m._12, m._21, m._22, m._41, m._42};
    }

    double determinant() const noexcept
    {
        return m11 * m22 - m12 * m21;
    }

    void apply(double x, double y, double& outX, double& outY) const noexcept
    {
        outX = x * m11 + y * m21 + tx;
        outY = x * m12 + y * m22 + ty;
    }

    void apply_inverse(double x, double y, double det, double& outX, double& outY) const noexcept
    {
        const double dx = x - tx;
        const double dy = y - ty;
        outX = (dx * m22 - dy * m21) / det;
        outY = (dy * m11 - dx * m12) / det;
    }
};
} // namespace

Canvas::Canvas(TextureData& target) noexcept : m_target{target}
{
    XMStoreFloat4x4(&m_state.transform, XMMatrixIdentity());
}

void Canvas::clear() noexcept
{
    std::fill(m_target.pixels.begin(), m_target.pixels.end(), uint8_t{0});
}

void Canvas::fill(const Color& color) noexcept
{
    if (m_target.empty())
        return;

    const auto rgba = color.to_rgba8();
    for (size_t i = 0; i + 3 < m_target.pixels.size(); i += TextureData::kChannels)
    {
        m_target.pixels[i + 0] = rgba[0];
        m_target.pixels[i + 1] = rgba[1];
        m_target.pixels[i + 2] = rgba[2];
        m_target.pixels[i + 3] = rgba[3];
    }
}

void Canvas::save()
{
    m_stack.push_back(m_state);
}

void Canvas::restore() noexcept
{
    if (m_stack.empty())
        return;
    m_state = m_stack.back();
    m_stack.pop_back();
}

// Each call applies to user space before the existing transform, matching canvas semantics:
// translate(); rotate(); scale(); maps a point through scale, then rotate, then translate.
void Canvas::premultiply_transform(const XMMATRIX& local) noexcept
{
    XMStoreFloat4x4(&m_state.transform, XMMatrixMultiply(local, XMLoadFloat4x4(&m_state.transform)));
}

void Canvas::translate(float x, float y) noexcept
{
    premultiply_transform(XMMatrixTranslation(x, y, 0.0f));
}

void Canvas::rotate(float radians) noexcept
{
    premultiply_transform(XMMatrixRotationZ(radians));
}

void Canvas::scale(float x, float y) noexcept
{
    premultiply_transform(XMMatrixScaling(x, y, 1.0f));
}

XMMATRIX Canvas::get_transform() const noexcept
{
    return XMLoadFloat4x4(&m_state.transform);
}

void Canvas::draw_image(const TextureData& image, float x, float y) noexcept
{
    draw_image(image, x, y, static_cast<float>(image.width), static_cast<float>(image.height));
}

void Canvas::draw_image(const TextureData& image, float x, float y, float width, float height) noexcept
{
    if (image.empty() || m_target.empty() || width == 0.0f || height == 0.0f)
        return;

    // Image pixel space -> user space -> target space.
    const Affine2D current = Affine2D::from(m_state.transform);
    const double sx = static_cast<double>(width) / image.width;
    const double sy = static_cast<double>(height) / image.height;
    Affine2D toTarget;
    toTarget.m11 = sx * current.m11;
    toTarget.m12 = sx * current.m12;
    toTarget.m21 = sy * current.m21;
    toTarget.m22 = sy * current.m22;
    current.apply(x, y, toTarget.tx, toTarget.ty);

    const double det = toTarget.determinant();
    if (det == 0.0)
        return;

    const bool clipsOutside = m_state.operation == CompositeOperation::SourceIn;

    std::uint32_t x0 = 0;
    std::uint32_t y0 = 0;
    std::uint32_t x1 = m_target.width;
    std::uint32_t y1 = m_target.height;

    if (!clipsOutside)
    {
        double minX = INFINITY, minY = INFINITY, maxX = -INFINITY, maxY = -INFINITY;
        const double cornersX[4] = {0.0, static_cast<double>(image.width), 0.0, static_cast<double>(image.width)};
        const double cornersY[4] = {0.0, 0.0, static_cast<double>(image.height), static_cast<double>(image.height)};
        for (int i = 0; i < 4; ++i)
        {
            double tx = 0.0;
            double ty = 0.0;
            toTarget.apply(cornersX[i], cornersY[i], tx, ty);
            minX = std::min(minX, tx);
            minY = std::min(minY, ty);
            maxX = std::max(maxX, tx);
            maxY = std::max(maxY, ty);
        }

        const double targetW = static_cast<double>(m_target.width);
        const double targetH = static_cast<double>(m_target.height);
        x0 = static_cast<std::uint32_t>(std::clamp(std::floor(minX), 0.0, targetW));
        y0 = static_cast<std::uint32_t>(std::clamp(std::floor(minY), 0.0, targetH));
        x1 = static_cast<std::uint32_t>(std::clamp(std::ceil(maxX), 0.0, targetW));
        y1 = static_cast<std::uint32_t>(std::clamp(std::ceil(maxY), 0.0, targetH));
    }

    const double imageW = static_cast<double>(image.width);
    const double imageH = static_cast<double>(image.height);

    for (std::uint32_t py = y0; py < y1; ++py)
    {
        for (std::uint32_t px = x0; px < x1; ++px)
        {
            double u = 0.0;
            double v = 0.0;
            toTarget.apply_inverse(px + 0.5, py + 0.5, det, u, v);

            uint8_t* dstPixel = m_target.pixel(px, py);
            const bool covered = u >= 0.0 && u < imageW && v >= 0.0 && v < imageH;
            if (!covered)
            {
                if (clipsOutside)
                    dstPixel[0] = dstPixel[1] = dstPixel[2] = dstPixel[3] = 0;
                continue;
            }

            const Premultiplied src = sample_bilinear(image, u, v);
            const Premultiplied dst = load_pixel(m_target, px, py);
            store_pixel(dstPixel, composite(src, dst, m_state.operation));
        }
    }
}
