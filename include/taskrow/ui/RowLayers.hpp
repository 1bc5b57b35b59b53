#pragma once

#include <taskrow/ui/ColorUtils.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace TR::UI {

struct Bounds {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;

    [[nodiscard]] static constexpr auto FromOrigin(float x, float y, float width, float height) -> Bounds {
        return Bounds{x, y, x + width, y + height};
    }

    [[nodiscard]] constexpr auto width() const -> float {
        return std::max(0.0f, max_x - min_x);
    }

    [[nodiscard]] constexpr auto height() const -> float {
        return std::max(0.0f, max_y - min_y);
    }

    [[nodiscard]] constexpr auto contains(float x, float y) const -> bool {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }

    constexpr auto move_to_x(float x) -> void {
        auto w = max_x - min_x;
        min_x = x;
        max_x = x + w;
    }

    [[nodiscard]] constexpr auto translated(float dx, float dy) const -> Bounds {
        return Bounds{min_x + dx, min_y + dy, max_x + dx, max_y + dy};
    }

    [[nodiscard]] constexpr auto inset(float dx, float dy) const -> Bounds {
        Bounds out{min_x + dx, min_y + dy, max_x - dx, max_y - dy};
        if (out.max_x < out.min_x) {
            out.max_x = out.min_x;
        }
        if (out.max_y < out.min_y) {
            out.max_y = out.min_y;
        }
        return out;
    }
};

// Listed in paint order, back to front.
enum class LayerKind : std::uint8_t {
    DoneIcon,
    DeleteIcon,
    Content,
    HighlightLine,
    ShadowLine,
    Overlay,
    Text,
};

inline constexpr std::size_t kLayerCount = 7;

[[nodiscard]] auto LayerKindToString(LayerKind kind) -> std::string_view;

struct Layer {
    LayerKind kind = LayerKind::Content;
    std::optional<LayerKind> parent{};
    // Relative to the parent layer, or to the row for top-level layers.
    Bounds frame{};
    float alpha = 1.0f;
    bool hidden = false;
    Color::Rgba background = Color::Clear;
};

class LayerStack {
public:
    LayerStack();

    [[nodiscard]] auto layer(LayerKind kind) -> Layer& { return layers_[index(kind)]; }
    [[nodiscard]] auto layer(LayerKind kind) const -> Layer const& { return layers_[index(kind)]; }

    // Frame in row coordinates, following parent offsets.
    [[nodiscard]] auto absolute_frame(LayerKind kind) const -> Bounds;
    // Product of the alphas along the parent chain; zero if any ancestor is hidden.
    [[nodiscard]] auto effective_alpha(LayerKind kind) const -> float;
    [[nodiscard]] auto effectively_hidden(LayerKind kind) const -> bool;

    [[nodiscard]] auto paint_order() const -> std::array<LayerKind, kLayerCount>;
    [[nodiscard]] auto layers() const -> std::array<Layer, kLayerCount> const& { return layers_; }

private:
    [[nodiscard]] static constexpr auto index(LayerKind kind) -> std::size_t {
        return static_cast<std::size_t>(kind);
    }

    std::array<Layer, kLayerCount> layers_{};
};

} // namespace TR::UI
