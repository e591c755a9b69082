#pragma once
#include "../../Core/Public/Core.hpp"

#include <cstdint>
#include <vector>

#include <DirectXMath.h>

struct TextureData;
class Color;

MKS_SUPPRESS_DLL_WARNINGS

/// How drawn pixels combine with the pixels already on the target.
enum class CompositeOperation : std::uint8_t
{
    /// Source painted over destination.
    SourceOver,
    /// Source kept only where the destination is opaque; everything else becomes transparent,
    /// including target pixels the source does not cover.
    SourceIn,
    /// Source replaces destination.
    Copy,
};

/// Immediate-mode 2D drawing onto a TextureData.
/// Keeps a current affine transform (translate/rotate/scale applied in call order, with
/// save/restore) and a composite operation. Images are resampled bilinearly by
/// inverse-mapping each target pixel center into image space.
class MKS_EXPORT Canvas
{
  public:
    explicit Canvas(TextureData& target) noexcept;

    TextureData& target() noexcept
    {
        return m_target;
    }

    /// Sets every pixel to transparent black.
    void clear() noexcept;

    /// Overwrites every pixel with the given color, ignoring transform and composite operation.
    void fill(const Color& color) noexcept;

    // ── State ──────────────────────────────────────────────────────────

    void save();
    void restore() noexcept;

    void translate(float x, float y) noexcept;
    void rotate(float radians) noexcept;
    void scale(float x, float y) noexcept;

    /// Returns the current user-space to target-space matrix (row-vector convention).
    DirectX::XMMATRIX get_transform() const noexcept;

    void set_composite_operation(CompositeOperation op) noexcept
    {
        m_state.operation = op;
    }
    CompositeOperation get_composite_operation() const noexcept
    {
        return m_state.operation;
    }

    // ── Drawing ────────────────────────────────────────────────────────

    /// Draws the image at its natural size with its top-left corner at (x, y).
    void draw_image(const TextureData& image, float x, float y) noexcept;

    /// Draws the image stretched into the user-space rectangle (x, y, width, height).
    void draw_image(const TextureData& image, float x, float y, float width, float height) noexcept;

  private:
    struct State
    {
        DirectX::XMFLOAT4X4 transform{};
        CompositeOperation operation{CompositeOperation::SourceOver};
    };

    void premultiply_transform(const DirectX::XMMATRIX& local) noexcept;

    TextureData& m_target;
    State m_state{};
    std::vector<State> m_stack;
};

MKS_RESTORE_DLL_WARNINGS
