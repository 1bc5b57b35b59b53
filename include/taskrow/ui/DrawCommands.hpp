#pragma once

#include <taskrow/ui/ColorUtils.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace TR::UI::Scene {

enum class DrawCommandKind : std::uint32_t {
    Rect = 0,
    Image = 1,
    TextRun = 2,
};

struct RectCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    Color::Rgba color{0.0f, 0.0f, 0.0f, 1.0f};
};

struct ImageCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    std::string asset;
    Color::Rgba tint{1.0f, 1.0f, 1.0f, 1.0f};
};

// The leading struck_length characters carry a thick strikethrough.
struct TextRunCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    std::string text;
    float font_size = 18.0f;
    std::size_t struck_length = 0;
    Color::Rgba color{1.0f, 1.0f, 1.0f, 1.0f};
};

using DrawCommand = std::variant<RectCommand, ImageCommand, TextRunCommand>;

[[nodiscard]] constexpr auto kind_of(DrawCommand const& command) -> DrawCommandKind {
    return static_cast<DrawCommandKind>(command.index());
}

using DrawList = std::vector<DrawCommand>;

} // namespace TR::UI::Scene
