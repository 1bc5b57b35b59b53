#include <taskrow/ui/RowDrawList.hpp>
#include <taskrow/ui/SwipeableRow.hpp>

namespace TR::UI {

namespace {

auto make_rect(Bounds const& frame, Color::Rgba color) -> Scene::RectCommand {
    Scene::RectCommand rect{};
    rect.min_x = frame.min_x;
    rect.min_y = frame.min_y;
    rect.max_x = frame.max_x;
    rect.max_y = frame.max_y;
    rect.color = color;
    return rect;
}

} // namespace

auto BuildRowDrawList(SwipeableRow const& row) -> Scene::DrawList {
    Scene::DrawList commands;
    auto const& layers = row.layers();
    auto const& config = row.config();

    for (auto kind : layers.paint_order()) {
        auto const opacity = row.alpha() * layers.effective_alpha(kind);
        if (opacity <= 0.0f) {
            continue;
        }
        auto const frame = layers.absolute_frame(kind);
        auto const& layer = layers.layer(kind);

        switch (kind) {
        case LayerKind::DoneIcon:
        case LayerKind::DeleteIcon: {
            Scene::ImageCommand image{};
            image.min_x = frame.min_x;
            image.min_y = frame.min_y;
            image.max_x = frame.max_x;
            image.max_y = frame.max_y;
            image.asset = kind == LayerKind::DoneIcon ? config.done_icon_asset : config.delete_icon_asset;
            image.tint = Color::Fade(Color::White, opacity);
            commands.emplace_back(std::move(image));
            break;
        }
        case LayerKind::Text: {
            auto const& field = row.text_field();
            auto const text_opacity = opacity * field.alpha();
            if (field.text().empty() || text_opacity <= 0.0f) {
                break;
            }
            Scene::TextRunCommand run{};
            run.min_x = frame.min_x;
            run.min_y = frame.min_y;
            run.max_x = frame.max_x;
            run.max_y = frame.max_y;
            run.text = field.text();
            run.font_size = field.font_size();
            run.struck_length = field.struck_length();
            run.color = Color::Fade(field.text_color(), text_opacity);
            commands.emplace_back(std::move(run));
            break;
        }
        case LayerKind::Content:
        case LayerKind::HighlightLine:
        case LayerKind::ShadowLine:
        case LayerKind::Overlay:
            if (!Color::IsClear(layer.background)) {
                commands.emplace_back(make_rect(frame, Color::Fade(layer.background, opacity)));
            }
            break;
        }
    }
    return commands;
}

} // namespace TR::UI
