#pragma once

#include <taskrow/core/Error.hpp>
#include <taskrow/ui/ColorUtils.hpp>
#include <taskrow/ui/SwipeFeedback.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace TR::UI {

struct RowColors {
    Color::Rgba complete_green{0.051f, 0.522f, 0.078f, 1.0f};
    Color::Rgba complete_dim{0.0f, 0.0f, 0.0f, 0.3f};
    Color::Rgba highlight_line{1.0f, 1.0f, 1.0f, 0.05f};
    Color::Rgba shadow_line{0.0f, 0.0f, 0.0f, 0.05f};
    Color::Rgba text{1.0f, 1.0f, 1.0f, 1.0f};
    Color::Rgba background{0.859f, 0.0f, 0.082f, 1.0f};
};

struct RowConfig {
    float icon_width = 40.0f;
    std::chrono::milliseconds settle_duration{200};
    std::chrono::milliseconds toggle_duration{200};
    float text_inset_x = 8.0f;
    float text_inset_y = 14.0f;
    float font_size = 18.0f;
    float completed_text_alpha = 0.3f;
    float backing_scale_factor = 2.0f;
    float default_width = 320.0f;
    float default_height = 60.0f;
    std::string done_icon_asset = "DoneIcon";
    std::string delete_icon_asset = "DeleteIcon";
    RowColors colors{};

    [[nodiscard]] auto geometry() const -> SwipeGeometry { return SwipeGeometry{icon_width}; }
    [[nodiscard]] auto border_thickness() const -> float { return 1.0f / backing_scale_factor; }
};

inline constexpr std::string_view kRowConfigEnv = "TASKROW_CONFIG";

auto ParseRowConfig(std::string_view json_text) -> TR::Expected<RowConfig>;
auto RowConfigFromJson(nlohmann::json const& json) -> TR::Expected<RowConfig>;
auto LoadRowConfig(std::filesystem::path const& path) -> TR::Expected<RowConfig>;

// Loads the file named by TASKROW_CONFIG, or returns the defaults when unset.
auto RowConfigFromEnv() -> TR::Expected<RowConfig>;

auto RowConfigToJson(RowConfig const& config) -> nlohmann::json;

} // namespace TR::UI
