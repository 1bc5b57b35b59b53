#include <taskrow/ui/RowLayers.hpp>

namespace TR::UI {

auto LayerKindToString(LayerKind kind) -> std::string_view {
    switch (kind) {
    case LayerKind::DoneIcon:
        return "done_icon";
    case LayerKind::DeleteIcon:
        return "delete_icon";
    case LayerKind::Content:
        return "content";
    case LayerKind::HighlightLine:
        return "highlight_line";
    case LayerKind::ShadowLine:
        return "shadow_line";
    case LayerKind::Overlay:
        return "overlay";
    case LayerKind::Text:
        return "text";
    }
    return "unknown";
}

LayerStack::LayerStack() {
    for (std::size_t i = 0; i < kLayerCount; ++i) {
        layers_[i].kind = static_cast<LayerKind>(i);
    }
    for (auto kind : {LayerKind::HighlightLine, LayerKind::ShadowLine, LayerKind::Overlay, LayerKind::Text}) {
        layer(kind).parent = LayerKind::Content;
    }
}

auto LayerStack::absolute_frame(LayerKind kind) const -> Bounds {
    auto const& target = layer(kind);
    auto frame = target.frame;
    auto parent = target.parent;
    while (parent) {
        auto const& ancestor = layer(*parent);
        frame = frame.translated(ancestor.frame.min_x, ancestor.frame.min_y);
        parent = ancestor.parent;
    }
    return frame;
}

auto LayerStack::effective_alpha(LayerKind kind) const -> float {
    float alpha = 1.0f;
    std::optional<LayerKind> current = kind;
    while (current) {
        auto const& entry = layer(*current);
        if (entry.hidden) {
            return 0.0f;
        }
        alpha *= entry.alpha;
        current = entry.parent;
    }
    return alpha;
}

auto LayerStack::effectively_hidden(LayerKind kind) const -> bool {
    return effective_alpha(kind) <= 0.0f;
}

auto LayerStack::paint_order() const -> std::array<LayerKind, kLayerCount> {
    std::array<LayerKind, kLayerCount> order{};
    for (std::size_t i = 0; i < kLayerCount; ++i) {
        order[i] = layers_[i].kind;
    }
    return order;
}

} // namespace TR::UI
