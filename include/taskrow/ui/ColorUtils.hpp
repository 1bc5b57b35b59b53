#pragma once

#include <algorithm>
#include <array>

namespace TR::UI::Color {

using Rgba = std::array<float, 4>;

inline constexpr Rgba Clear{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Rgba White{1.0f, 1.0f, 1.0f, 1.0f};

// Multiplies the alpha channel by the effective opacity of the layer chain.
inline auto Fade(Rgba color, float opacity) -> Rgba {
    color[3] = std::clamp(color[3] * opacity, 0.0f, 1.0f);
    return color;
}

[[nodiscard]] inline auto IsClear(Rgba const& color) -> bool {
    return color[3] <= 0.0f;
}

} // namespace TR::UI::Color
