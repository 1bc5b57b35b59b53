#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace TR::UI {

enum class PanPhase : std::uint8_t {
    Began,
    Changed,
    Ended,
    Cancelled,
};

[[nodiscard]] auto PanPhaseToString(PanPhase phase) -> std::string_view;

enum class RecognizerState : std::uint8_t {
    Idle,
    Possible,
    Tracking,
    Failed,
};

struct PanTranslation {
    float x = 0.0f;
    float y = 0.0f;
};

// Turns raw pointer samples into pan phases. The claim decision is made once,
// on the first sample that moves, from that sample's delta.
class PanGestureRecognizer {
public:
    using ShouldBegin = std::function<bool(float dx, float dy)>;
    using Handler = std::function<void(PanPhase phase, PanTranslation translation)>;

    PanGestureRecognizer() = default;
    PanGestureRecognizer(ShouldBegin should_begin, Handler handler);

    auto set_should_begin(ShouldBegin should_begin) -> void { should_begin_ = std::move(should_begin); }
    auto set_handler(Handler handler) -> void { handler_ = std::move(handler); }

    auto pointer_down(float x, float y) -> void;
    auto pointer_move(float x, float y) -> void;
    auto pointer_up(float x, float y) -> void;
    auto cancel() -> void;
    // Drops any gesture in progress without emitting a phase.
    auto reset() -> void;

    [[nodiscard]] auto state() const -> RecognizerState { return state_; }
    [[nodiscard]] auto translation() const -> PanTranslation { return translation_; }

private:
    auto emit(PanPhase phase) -> void;

    ShouldBegin should_begin_;
    Handler handler_;
    RecognizerState state_ = RecognizerState::Idle;
    float origin_x_ = 0.0f;
    float origin_y_ = 0.0f;
    float last_x_ = 0.0f;
    float last_y_ = 0.0f;
    PanTranslation translation_{};
};

} // namespace TR::UI
