#pragma once

#include <taskrow/ui/DrawCommands.hpp>
#include <taskrow/ui/RowDrawList.hpp>
#include <taskrow/ui/SwipeableRow.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <type_traits>
#include <variant>

namespace TR::UI::Diagnostics {

inline auto bounds_to_json(Bounds const& bounds) -> nlohmann::json {
    return nlohmann::json{{"min_x", bounds.min_x},
                          {"min_y", bounds.min_y},
                          {"max_x", bounds.max_x},
                          {"max_y", bounds.max_y}};
}

inline auto layer_to_json(LayerStack const& layers, LayerKind kind) -> nlohmann::json {
    auto const& layer = layers.layer(kind);
    return nlohmann::json{{"kind", LayerKindToString(kind)},
                          {"frame", bounds_to_json(layers.absolute_frame(kind))},
                          {"alpha", layer.alpha},
                          {"hidden", layer.hidden},
                          {"background", layer.background}};
}

inline auto row_snapshot_to_json(SwipeableRow const& row) -> nlohmann::json {
    using nlohmann::json;

    auto const& field = row.text_field();
    json text{{"value", field.text()},
              {"alpha", field.alpha()},
              {"editable", field.editable()},
              {"editing", field.is_editing()},
              {"struck_length", field.struck_length()}};

    json layers = json::array();
    for (auto kind : row.layers().paint_order()) {
        layers.push_back(layer_to_json(row.layers(), kind));
    }

    return json{{"identifier", row.identifier()},
                {"completed", row.completed()},
                {"editable", row.editable()},
                {"gesture_state", RowGestureStateToString(row.gesture_state())},
                {"release_intent", ReleaseIntentToString(row.release_intent())},
                {"content_offset", row.content_offset()},
                {"alpha", row.alpha()},
                {"width", row.width()},
                {"height", row.height()},
                {"done_icon", {{"x", row.done_icon().frame.min_x}, {"alpha", row.done_icon().alpha}}},
                {"delete_icon", {{"x", row.delete_icon().frame.min_x}, {"alpha", row.delete_icon().alpha}}},
                {"overlay", {{"hidden", row.overlay().hidden}, {"color", row.overlay().background}}},
                {"text", std::move(text)},
                {"layers", std::move(layers)}};
}

inline auto draw_command_to_json(Scene::DrawCommand const& command) -> nlohmann::json {
    return std::visit(
        [](auto const& payload) -> nlohmann::json {
            using Payload = std::decay_t<decltype(payload)>;
            nlohmann::json out{{"min_x", payload.min_x},
                               {"min_y", payload.min_y},
                               {"max_x", payload.max_x},
                               {"max_y", payload.max_y}};
            if constexpr (std::is_same_v<Payload, Scene::RectCommand>) {
                out["kind"] = "rect";
                out["color"] = payload.color;
            } else if constexpr (std::is_same_v<Payload, Scene::ImageCommand>) {
                out["kind"] = "image";
                out["asset"] = payload.asset;
                out["tint"] = payload.tint;
            } else {
                out["kind"] = "text";
                out["text"] = payload.text;
                out["font_size"] = payload.font_size;
                out["struck_length"] = payload.struck_length;
                out["color"] = payload.color;
            }
            return out;
        },
        command);
}

inline auto draw_list_to_json(Scene::DrawList const& commands) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (auto const& command : commands) {
        out.push_back(draw_command_to_json(command));
    }
    return out;
}

} // namespace TR::UI::Diagnostics
