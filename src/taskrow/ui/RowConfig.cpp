#include <taskrow/ui/RowConfig.hpp>

#include "utils/TaggedLogger.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace TR::UI {

namespace {

auto type_error(std::string_view key, std::string_view expected) -> TR::Error {
    std::string message{"'"};
    message.append(key);
    message.append("' must be ");
    message.append(expected);
    return TR::Error{TR::Error::Code::InvalidType, std::move(message)};
}

auto range_error(std::string_view key, std::string_view constraint) -> TR::Error {
    std::string message{"'"};
    message.append(key);
    message.append("' ");
    message.append(constraint);
    return TR::Error{TR::Error::Code::OutOfRange, std::move(message)};
}

auto read_float(nlohmann::json const& json, char const* key, float& out) -> TR::Expected<void> {
    auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (!it->is_number()) {
        return std::unexpected{type_error(key, "a number")};
    }
    out = it->get<float>();
    return {};
}

auto read_duration(nlohmann::json const& json,
                   char const* key,
                   std::chrono::milliseconds& out) -> TR::Expected<void> {
    auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (!it->is_number_integer()) {
        return std::unexpected{type_error(key, "an integer number of milliseconds")};
    }
    auto value = it->get<std::int64_t>();
    if (value < 0) {
        return std::unexpected{range_error(key, "must not be negative")};
    }
    out = std::chrono::milliseconds{value};
    return {};
}

auto read_string(nlohmann::json const& json, char const* key, std::string& out) -> TR::Expected<void> {
    auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected{type_error(key, "a string")};
    }
    out = it->get<std::string>();
    return {};
}

auto read_color(nlohmann::json const& json, char const* key, Color::Rgba& out) -> TR::Expected<void> {
    auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (!it->is_array() || it->size() != 4) {
        return std::unexpected{type_error(key, "an [r, g, b, a] array")};
    }
    Color::Rgba parsed{};
    for (std::size_t i = 0; i < 4; ++i) {
        auto const& component = (*it)[i];
        if (!component.is_number()) {
            return std::unexpected{type_error(key, "an [r, g, b, a] array")};
        }
        parsed[i] = component.get<float>();
        if (parsed[i] < 0.0f || parsed[i] > 1.0f) {
            return std::unexpected{range_error(key, "components must be within [0, 1]")};
        }
    }
    out = parsed;
    return {};
}

auto validate(RowConfig const& config) -> TR::Expected<void> {
    if (!(config.icon_width > 0.0f)) {
        return std::unexpected{range_error("icon_width", "must be positive")};
    }
    if (!(config.backing_scale_factor > 0.0f)) {
        return std::unexpected{range_error("backing_scale_factor", "must be positive")};
    }
    if (config.completed_text_alpha < 0.0f || config.completed_text_alpha > 1.0f) {
        return std::unexpected{range_error("completed_text_alpha", "must be within [0, 1]")};
    }
    if (config.font_size <= 0.0f) {
        return std::unexpected{range_error("font_size", "must be positive")};
    }
    if (config.default_width <= 0.0f || config.default_height <= 0.0f) {
        return std::unexpected{range_error("default_width/default_height", "must be positive")};
    }
    return {};
}

} // namespace

auto RowConfigFromJson(nlohmann::json const& json) -> TR::Expected<RowConfig> {
    if (!json.is_object()) {
        return std::unexpected{TR::Error{TR::Error::Code::InvalidType, "row config must be a JSON object"}};
    }

    RowConfig config{};
    for (auto const& status : {read_float(json, "icon_width", config.icon_width),
                               read_duration(json, "settle_duration_ms", config.settle_duration),
                               read_duration(json, "toggle_duration_ms", config.toggle_duration),
                               read_float(json, "text_inset_x", config.text_inset_x),
                               read_float(json, "text_inset_y", config.text_inset_y),
                               read_float(json, "font_size", config.font_size),
                               read_float(json, "completed_text_alpha", config.completed_text_alpha),
                               read_float(json, "backing_scale_factor", config.backing_scale_factor),
                               read_float(json, "default_width", config.default_width),
                               read_float(json, "default_height", config.default_height),
                               read_string(json, "done_icon_asset", config.done_icon_asset),
                               read_string(json, "delete_icon_asset", config.delete_icon_asset)}) {
        if (!status) {
            return std::unexpected{status.error()};
        }
    }

    if (auto colors = json.find("colors"); colors != json.end()) {
        if (!colors->is_object()) {
            return std::unexpected{type_error("colors", "an object")};
        }
        auto& target = config.colors;
        for (auto const& status : {read_color(*colors, "complete_green", target.complete_green),
                                   read_color(*colors, "complete_dim", target.complete_dim),
                                   read_color(*colors, "highlight_line", target.highlight_line),
                                   read_color(*colors, "shadow_line", target.shadow_line),
                                   read_color(*colors, "text", target.text),
                                   read_color(*colors, "background", target.background)}) {
            if (!status) {
                return std::unexpected{status.error()};
            }
        }
    }

    if (auto valid = validate(config); !valid) {
        return std::unexpected{valid.error()};
    }
    return config;
}

auto ParseRowConfig(std::string_view json_text) -> TR::Expected<RowConfig> {
    auto parsed = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected{TR::Error{TR::Error::Code::MalformedInput, "row config is not valid JSON"}};
    }
    return RowConfigFromJson(parsed);
}

auto LoadRowConfig(std::filesystem::path const& path) -> TR::Expected<RowConfig> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound, "row config '" + path.string() + "' does not exist"}};
    }
    std::ifstream input(path);
    if (!input) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound, "failed to open row config '" + path.string() + "'"}};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto config = ParseRowConfig(buffer.str());
    if (!config) {
        tr_log("Rejected row config " + path.string() + ": " + describeError(config.error()), "RowConfig", "ERROR");
    }
    return config;
}

auto RowConfigFromEnv() -> TR::Expected<RowConfig> {
    auto const* value = std::getenv(std::string(kRowConfigEnv).c_str());
    if (value == nullptr || value[0] == '\0') {
        return RowConfig{};
    }
    return LoadRowConfig(std::filesystem::path{value});
}

auto RowConfigToJson(RowConfig const& config) -> nlohmann::json {
    auto const& c = config.colors;
    return nlohmann::json{{"icon_width", config.icon_width},
                          {"settle_duration_ms", config.settle_duration.count()},
                          {"toggle_duration_ms", config.toggle_duration.count()},
                          {"text_inset_x", config.text_inset_x},
                          {"text_inset_y", config.text_inset_y},
                          {"font_size", config.font_size},
                          {"completed_text_alpha", config.completed_text_alpha},
                          {"backing_scale_factor", config.backing_scale_factor},
                          {"default_width", config.default_width},
                          {"default_height", config.default_height},
                          {"done_icon_asset", config.done_icon_asset},
                          {"delete_icon_asset", config.delete_icon_asset},
                          {"colors",
                           {{"complete_green", c.complete_green},
                            {"complete_dim", c.complete_dim},
                            {"highlight_line", c.highlight_line},
                            {"shadow_line", c.shadow_line},
                            {"text", c.text},
                            {"background", c.background}}}};
}

} // namespace TR::UI
