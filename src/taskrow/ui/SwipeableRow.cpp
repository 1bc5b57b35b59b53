#include <taskrow/ui/SwipeableRow.hpp>
#include <taskrow/ui/SwipeTrace.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>

namespace TR::UI {

auto RowGestureStateToString(RowGestureState state) -> std::string_view {
    switch (state) {
    case RowGestureState::Idle:
        return "idle";
    case RowGestureState::Dragging:
        return "dragging";
    case RowGestureState::SettlingComplete:
        return "settling_complete";
    case RowGestureState::SettlingDelete:
        return "settling_delete";
    case RowGestureState::SettlingReset:
        return "settling_reset";
    }
    return "unknown";
}

SwipeableRow::SwipeableRow(std::string identifier, RowHost host, RowConfig config)
    : identifier_(std::move(identifier))
    , host_(host)
    , config_(std::move(config))
    , geometry_(config_.geometry())
    , text_field_(host.focus) {
    text_field_.set_delegate(this);
    text_field_.set_font_size(config_.font_size);
    text_field_.set_text_color(config_.colors.text);

    content().background = config_.colors.background;
    layers_.layer(LayerKind::HighlightLine).background = config_.colors.highlight_line;
    layers_.layer(LayerKind::ShadowLine).background = config_.colors.shadow_line;
    layers_.layer(LayerKind::DoneIcon).alpha = 0.0f;
    layers_.layer(LayerKind::DeleteIcon).alpha = 0.0f;

    recognizer_.set_should_begin([this](float dx, float dy) { return should_begin_gesture(dx, dy); });
    recognizer_.set_handler([this](PanPhase phase, PanTranslation translation) {
        handle_pan(phase, translation.x);
    });

    resize(config_.default_width, config_.default_height);
    set_completed(false);
}

SwipeableRow::~SwipeableRow() {
    cancel_animations();
}

auto SwipeableRow::Restore([[maybe_unused]] nlohmann::json const& archive,
                           RowHost /*host*/,
                           RowConfig /*config*/) -> TR::Expected<std::unique_ptr<SwipeableRow>> {
    tr_log("Refusing to restore a row from an archived layout (" + std::to_string(archive.size()) + " keys)", "SwipeRow", "ERROR");
    return std::unexpected{TR::Error{TR::Error::Code::NotSupported,
                                     "restoring a task row from an archived layout is not supported"}};
}

auto SwipeableRow::configure(TaskSnapshot const& task) -> void {
    text_field_.set_text(task.text);
    set_completed(task.completed);
}

auto SwipeableRow::set_completed(bool completed) -> void {
    completed_ = completed;
    completed ? text_field_.strike() : text_field_.unstrike();

    auto& overlay = layers_.layer(LayerKind::Overlay);
    overlay.hidden = !completed;
    overlay.background = completed ? config_.colors.complete_dim : config_.colors.complete_green;

    text_field_.set_alpha(completed ? config_.completed_text_alpha : 1.0f);
    text_field_.set_editable(!completed);
}

auto SwipeableRow::set_editable(bool requested) -> void {
    text_field_.set_editable(requested && !completed_);
}

auto SwipeableRow::background_color() const -> Color::Rgba const& {
    return content().background;
}

auto SwipeableRow::set_background_color(Color::Rgba color) -> void {
    content().background = color;
}

auto SwipeableRow::prepare_for_reuse() -> void {
    cancel_animations();
    recognizer_.reset();
    toggle_pending_ = false;
    alpha_ = 1.0f;
    content().frame.move_to_x(0.0f);
    reset_icons();
    layers_.layer(LayerKind::DoneIcon).alpha = 0.0f;
    layers_.layer(LayerKind::DeleteIcon).alpha = 0.0f;
    release_intent_ = ReleaseIntent::None;
    gesture_state_ = RowGestureState::Idle;
}

auto SwipeableRow::resize(float width, float height) -> void {
    auto previous_width = width_;
    width_ = std::max(0.0f, width);
    height_ = std::max(0.0f, height);
    layout();

    // The delete icon is pinned to the trailing edge.
    auto& delete_icon = layers_.layer(LayerKind::DeleteIcon);
    if (previous_width == 0.0f) {
        reset_icons();
    } else {
        delete_icon.frame.move_to_x(delete_icon.frame.min_x + (width_ - previous_width));
    }
}

auto SwipeableRow::layout() -> void {
    auto offset = content().frame.min_x;
    content().frame = Bounds::FromOrigin(offset, 0.0f, width_, height_);

    auto& done_icon = layers_.layer(LayerKind::DoneIcon);
    done_icon.frame = Bounds::FromOrigin(done_icon.frame.min_x, 0.0f, geometry_.icon_width, height_);
    auto& delete_icon = layers_.layer(LayerKind::DeleteIcon);
    delete_icon.frame = Bounds::FromOrigin(delete_icon.frame.min_x, 0.0f, geometry_.icon_width, height_);

    auto line = std::min(config_.border_thickness(), height_);
    layers_.layer(LayerKind::HighlightLine).frame = Bounds::FromOrigin(0.0f, 0.0f, width_, line);
    layers_.layer(LayerKind::ShadowLine).frame = Bounds::FromOrigin(0.0f, height_ - line, width_, line);

    auto const local = Bounds::FromOrigin(0.0f, 0.0f, width_, height_);
    layers_.layer(LayerKind::Overlay).frame = local;
    layers_.layer(LayerKind::Text).frame = local.inset(config_.text_inset_x, config_.text_inset_y);
}

auto SwipeableRow::reset_icons() -> void {
    layers_.layer(LayerKind::DoneIcon).frame.move_to_x(RestingDoneIconX(geometry_));
    layers_.layer(LayerKind::DeleteIcon).frame.move_to_x(RestingDeleteIconX(geometry_, width_));
}

auto SwipeableRow::content_offset() const -> float {
    return content().frame.min_x;
}

auto SwipeableRow::become_first_responder() -> bool {
    if (trace_) {
        trace_->record(SwipeTraceEventKind::FocusRequest);
    }
    return text_field_.request_focus_override();
}

auto SwipeableRow::pointer_down(float x, float y) -> void {
    if (trace_) {
        trace_->record(SwipeTraceEventKind::PointerDown, x, y);
    }
    recognizer_.pointer_down(x, y);
}

auto SwipeableRow::pointer_move(float x, float y) -> void {
    if (trace_) {
        trace_->record(SwipeTraceEventKind::PointerMove, x, y);
    }
    recognizer_.pointer_move(x, y);
}

auto SwipeableRow::pointer_up(float x, float y) -> void {
    if (trace_) {
        trace_->record(SwipeTraceEventKind::PointerUp, x, y);
    }
    recognizer_.pointer_up(x, y);
}

auto SwipeableRow::cancel_pointer() -> void {
    if (trace_) {
        trace_->record(SwipeTraceEventKind::PointerCancel);
    }
    recognizer_.cancel();
}

auto SwipeableRow::should_begin_gesture(float dx, float dy) const -> bool {
    if (host_.focus.first_responder() == &text_field_) {
        return false;
    }
    if (gesture_state_ == RowGestureState::SettlingDelete) {
        return false;
    }
    return std::fabs(dx) > std::fabs(dy);
}

auto SwipeableRow::handle_pan(PanPhase phase, float translation_x) -> void {
    // A row sliding out for deletion takes no further gestures.
    if (gesture_state_ == RowGestureState::SettlingDelete) {
        return;
    }
    switch (phase) {
    case PanPhase::Began:
        begin_drag();
        break;
    case PanPhase::Changed:
        if (gesture_state_ != RowGestureState::Dragging) {
            begin_drag();
        }
        update_drag(translation_x);
        break;
    case PanPhase::Ended:
        if (gesture_state_ == RowGestureState::Dragging) {
            end_drag();
        }
        break;
    case PanPhase::Cancelled:
        if (gesture_state_ == RowGestureState::Dragging) {
            tr_log("Swipe cancelled on row " + identifier_, "SwipeRow", "Gesture");
            release_intent_ = ReleaseIntent::None;
            set_completed(completed_);
            settle_reset();
        }
        break;
    }
}

auto SwipeableRow::begin_drag() -> void {
    tr_log("Swipe began on row " + identifier_, "SwipeRow", "Gesture");
    supersede_settle();
    host_.focus.clear();
    release_intent_ = ReleaseIntent::None;
    gesture_state_ = RowGestureState::Dragging;
}

auto SwipeableRow::update_drag(float translation_x) -> void {
    auto feedback = ComputeSwipeFeedback(translation_x, geometry_, width_);
    content().frame.move_to_x(feedback.translation);

    auto& done_icon = layers_.layer(LayerKind::DoneIcon);
    auto& delete_icon = layers_.layer(LayerKind::DeleteIcon);
    done_icon.frame.move_to_x(feedback.done_icon_x);
    delete_icon.frame.move_to_x(feedback.delete_icon_x);
    done_icon.alpha = feedback.fraction;
    delete_icon.alpha = feedback.fraction;

    release_intent_ = feedback.intent;
    apply_drag_feedback(feedback);
}

// Previews the toggle the release would commit, whatever the current state.
auto SwipeableRow::apply_drag_feedback(SwipeFeedback const& feedback) -> void {
    auto& overlay = layers_.layer(LayerKind::Overlay);
    bool const completing = release_intent_ == ReleaseIntent::Complete;
    bool const dragging_right = content_offset() > 0.0f;

    if (completed_) {
        overlay.hidden = completing;
        text_field_.set_alpha(completing ? 1.0f : config_.completed_text_alpha);
        if (dragging_right) {
            text_field_.strike(1.0f - feedback.fraction);
        } else {
            completing ? text_field_.unstrike() : text_field_.strike();
        }
    } else {
        overlay.background = config_.colors.complete_green;
        overlay.hidden = !completing;
        if (dragging_right) {
            text_field_.strike(feedback.fraction);
        } else {
            completing ? text_field_.strike() : text_field_.unstrike();
        }
    }
}

auto SwipeableRow::end_drag() -> void {
    tr_log("Swipe ended on row " + identifier_ + " with intent " + std::string(ReleaseIntentToString(release_intent_)), "SwipeRow", "Gesture");
    switch (release_intent_) {
    case ReleaseIntent::Complete:
        settle_complete();
        break;
    case ReleaseIntent::Delete:
        settle_delete();
        break;
    case ReleaseIntent::None:
        completed_ ? text_field_.strike() : text_field_.unstrike();
        settle_reset();
        break;
    }
}

// Stops a running settle so the new drag owns the content layer. A pending
// completion is committed at once instead of being dropped.
auto SwipeableRow::supersede_settle() -> void {
    auto const settling = gesture_state_;
    if (settling == RowGestureState::Idle || settling == RowGestureState::Dragging) {
        return;
    }
    tr_log("Settle " + std::string(RowGestureStateToString(settling)) + " superseded on row " + identifier_, "SwipeRow", "Gesture");
    cancel_animations();
    reset_icons();
    gesture_state_ = RowGestureState::Idle;
    if (settling != RowGestureState::SettlingComplete) {
        return;
    }
    // Either flips the state or snaps the toggle fade to its final alpha.
    set_completed(toggle_pending_ ? !completed_ : completed_);
    toggle_pending_ = false;
    notify_completed();
}

auto SwipeableRow::settle_complete() -> void {
    gesture_state_ = RowGestureState::SettlingComplete;
    toggle_pending_ = true;
    auto& content_layer = content();
    std::vector<PropertyTween> tweens{
        PropertyTween{&content_layer.frame.min_x, 0.0f},
        PropertyTween{&content_layer.frame.max_x, width_},
        PropertyTween{&layers_.layer(LayerKind::DoneIcon).alpha, 0.0f},
        PropertyTween{&layers_.layer(LayerKind::DeleteIcon).alpha, 0.0f},
    };
    track(host_.animator.animate(config_.settle_duration, std::move(tweens), [this] {
        reset_icons();
        toggle_completed();
    }));
}

auto SwipeableRow::toggle_completed() -> void {
    toggle_pending_ = false;
    auto from_alpha = text_field_.alpha();
    set_completed(!completed_);
    std::vector<PropertyTween> tweens{
        PropertyTween{&text_field_.alpha_ref(), text_field_.alpha(), from_alpha},
    };
    track(host_.animator.animate(config_.toggle_duration, std::move(tweens), [this] {
        if (gesture_state_ == RowGestureState::SettlingComplete) {
            gesture_state_ = RowGestureState::Idle;
        }
        notify_completed();
    }));
}

auto SwipeableRow::notify_completed() -> void {
    if (auto delegate = delegate_.lock()) {
        tr_log("Row " + identifier_ + (completed_ ? " completed" : " reopened"), "SwipeRow");
        delegate->row_did_complete(*this, completed_);
    }
}

auto SwipeableRow::settle_delete() -> void {
    gesture_state_ = RowGestureState::SettlingDelete;
    auto const threshold = geometry_.swipe_threshold();
    auto& content_layer = content();
    auto& delete_icon = layers_.layer(LayerKind::DeleteIcon);
    auto const content_target = -content_layer.frame.width() - threshold;
    auto const delete_target = -threshold + geometry_.icon_width + geometry_.icon_offset();
    std::vector<PropertyTween> tweens{
        PropertyTween{&alpha_, 0.0f},
        PropertyTween{&content_layer.frame.min_x, content_target},
        PropertyTween{&content_layer.frame.max_x, content_target + content_layer.frame.width()},
        PropertyTween{&delete_icon.frame.min_x, delete_target},
        PropertyTween{&delete_icon.frame.max_x, delete_target + delete_icon.frame.width()},
    };
    track(host_.animator.animate(config_.settle_duration, std::move(tweens), [this] {
        reset_icons();
        if (gesture_state_ == RowGestureState::SettlingDelete) {
            gesture_state_ = RowGestureState::Idle;
        }
        // The delegate may destroy this row; nothing may follow the call.
        if (auto delegate = delegate_.lock()) {
            tr_log("Row " + identifier_ + " requested delete", "SwipeRow");
            delegate->row_did_request_delete(*this);
        }
    }));
}

auto SwipeableRow::settle_reset() -> void {
    gesture_state_ = RowGestureState::SettlingReset;
    auto& content_layer = content();
    std::vector<PropertyTween> tweens{
        PropertyTween{&content_layer.frame.min_x, 0.0f},
        PropertyTween{&content_layer.frame.max_x, width_},
        PropertyTween{&layers_.layer(LayerKind::DoneIcon).alpha, 0.0f},
        PropertyTween{&layers_.layer(LayerKind::DeleteIcon).alpha, 0.0f},
    };
    track(host_.animator.animate(config_.settle_duration, std::move(tweens), [this] {
        reset_icons();
        if (gesture_state_ == RowGestureState::SettlingReset) {
            gesture_state_ = RowGestureState::Idle;
        }
    }));
}

auto SwipeableRow::track(AnimationId id) -> void {
    std::erase_if(animations_, [this](AnimationId existing) { return !host_.animator.contains(existing); });
    animations_.push_back(id);
}

auto SwipeableRow::cancel_animations() -> void {
    for (auto id : animations_) {
        (void)host_.animator.cancel(id);
    }
    animations_.clear();
}

auto SwipeableRow::text_field_did_begin_editing(TaskTextField& /*field*/) -> void {
    if (auto delegate = delegate_.lock()) {
        delegate->row_did_begin_editing(*this);
    }
}

auto SwipeableRow::text_field_did_change_text(TaskTextField& /*field*/) -> void {
    if (auto delegate = delegate_.lock()) {
        delegate->row_did_change_text(*this);
    }
}

auto SwipeableRow::text_field_did_end_editing(TaskTextField& /*field*/) -> void {
    if (auto delegate = delegate_.lock()) {
        delegate->row_did_end_editing(*this);
    }
}

} // namespace TR::UI
