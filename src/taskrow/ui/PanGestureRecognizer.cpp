#include <taskrow/ui/PanGestureRecognizer.hpp>

#include "utils/TaggedLogger.hpp"

namespace TR::UI {

auto PanPhaseToString(PanPhase phase) -> std::string_view {
    switch (phase) {
    case PanPhase::Began:
        return "began";
    case PanPhase::Changed:
        return "changed";
    case PanPhase::Ended:
        return "ended";
    case PanPhase::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

PanGestureRecognizer::PanGestureRecognizer(ShouldBegin should_begin, Handler handler)
    : should_begin_(std::move(should_begin))
    , handler_(std::move(handler)) {}

auto PanGestureRecognizer::pointer_down(float x, float y) -> void {
    if (state_ == RecognizerState::Tracking) {
        cancel();
    }
    state_ = RecognizerState::Possible;
    origin_x_ = last_x_ = x;
    origin_y_ = last_y_ = y;
    translation_ = {};
}

auto PanGestureRecognizer::pointer_move(float x, float y) -> void {
    switch (state_) {
    case RecognizerState::Idle:
    case RecognizerState::Failed:
        return;
    case RecognizerState::Possible: {
        float dx = x - last_x_;
        float dy = y - last_y_;
        if (dx == 0.0f && dy == 0.0f) {
            return;
        }
        if (should_begin_ && !should_begin_(dx, dy)) {
            tr_log("Pan gesture declined", "Gesture");
            state_ = RecognizerState::Failed;
            return;
        }
        state_ = RecognizerState::Tracking;
        emit(PanPhase::Began);
        break;
    }
    case RecognizerState::Tracking:
        break;
    }

    last_x_ = x;
    last_y_ = y;
    translation_ = PanTranslation{x - origin_x_, y - origin_y_};
    emit(PanPhase::Changed);
}

auto PanGestureRecognizer::pointer_up(float x, float y) -> void {
    if (state_ == RecognizerState::Tracking) {
        if (x != last_x_ || y != last_y_) {
            pointer_move(x, y);
        }
        state_ = RecognizerState::Idle;
        emit(PanPhase::Ended);
        return;
    }
    state_ = RecognizerState::Idle;
}

auto PanGestureRecognizer::cancel() -> void {
    if (state_ == RecognizerState::Tracking) {
        state_ = RecognizerState::Idle;
        emit(PanPhase::Cancelled);
        return;
    }
    state_ = RecognizerState::Idle;
}

auto PanGestureRecognizer::reset() -> void {
    state_ = RecognizerState::Idle;
    translation_ = {};
}

auto PanGestureRecognizer::emit(PanPhase phase) -> void {
    if (handler_) {
        handler_(phase, translation_);
    }
}

} // namespace TR::UI
