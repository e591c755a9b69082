#pragma once
#include "../../Core/Public/Core.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <string>

#include <DirectXMath.h>
#include <fmt/core.h>

/// Immutable RGBA color with float components in [0, 1].
/// Materials are never mutated through a Color; writes go through MaterialMutator.
class Color
{
  public:
    constexpr Color() noexcept = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) noexcept : m_r{r}, m_g{g}, m_b{b}, m_a{a}
    {}

    constexpr float r() const noexcept
    {
        return m_r;
    }
    constexpr float g() const noexcept
    {
        return m_g;
    }
    constexpr float b() const noexcept
    {
        return m_b;
    }
    constexpr float a() const noexcept
    {
        return m_a;
    }

    DirectX::XMFLOAT4 to_float4() const noexcept
    {
        return {m_r, m_g, m_b, m_a};
    }

    DirectX::XMFLOAT3 to_float3() const noexcept
    {
        return {m_r, m_g, m_b};
    }

    /// Quantizes to 8-bit RGBA, rounding each clamped component.
    std::array<std::uint8_t, 4> to_rgba8() const noexcept
    {
        auto quantize = [](float v) {
            return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        };
        return {quantize(m_r), quantize(m_g), quantize(m_b), quantize(m_a)};
    }

    /// Exact component tuple serialization ("r,g,b,a", shortest round-trip form).
    std::string key() const
    {
        return fmt::format("{},{},{},{}", m_r, m_g, m_b, m_a);
    }

    constexpr bool operator==(const Color&) const noexcept = default;

  private:
    float m_r{0.0f};
    float m_g{0.0f};
    float m_b{0.0f};
    float m_a{1.0f};
};
