#pragma once

#include <taskrow/core/Error.hpp>
#include <taskrow/ui/ColorUtils.hpp>
#include <taskrow/ui/FocusScope.hpp>
#include <taskrow/ui/PanGestureRecognizer.hpp>
#include <taskrow/ui/RowConfig.hpp>
#include <taskrow/ui/RowLayers.hpp>
#include <taskrow/ui/SettleAnimator.hpp>
#include <taskrow/ui/SwipeFeedback.hpp>
#include <taskrow/ui/TaskTextField.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TR::UI {

struct TaskSnapshot {
    std::string text;
    bool completed = false;
};

class SwipeableRow;
class SwipeTrace;

// Receives row outcomes on the UI thread. The row holds it weakly.
// row_did_complete may also arrive from inside a new pan's Began, when that
// pan supersedes a completing settle; the row must stay alive for that call.
class RowDelegate {
public:
    virtual ~RowDelegate() = default;

    virtual auto row_did_complete(SwipeableRow& row, bool completed) -> void = 0;
    virtual auto row_did_request_delete(SwipeableRow& row) -> void = 0;

    virtual auto row_did_begin_editing(SwipeableRow& row) -> void = 0;
    virtual auto row_did_change_text(SwipeableRow& row) -> void = 0;
    virtual auto row_did_end_editing(SwipeableRow& row) -> void = 0;
};

// Window-level services shared by every row; both must outlive the row.
struct RowHost {
    FocusScope& focus;
    SettleAnimator& animator;
};

enum class RowGestureState : std::uint8_t {
    Idle,
    Dragging,
    SettlingComplete,
    SettlingDelete,
    SettlingReset,
};

[[nodiscard]] auto RowGestureStateToString(RowGestureState state) -> std::string_view;

class SwipeableRow final : private TextFieldDelegate {
public:
    SwipeableRow(std::string identifier, RowHost host, RowConfig config = {});
    ~SwipeableRow() override;

    SwipeableRow(SwipeableRow const&) = delete;
    SwipeableRow& operator=(SwipeableRow const&) = delete;
    SwipeableRow(SwipeableRow&&) = delete;
    SwipeableRow& operator=(SwipeableRow&&) = delete;

    // Rows cannot be rebuilt from an archived layout; always NotSupported.
    static auto Restore(nlohmann::json const& archive,
                        RowHost host,
                        RowConfig config = {}) -> TR::Expected<std::unique_ptr<SwipeableRow>>;

    [[nodiscard]] auto identifier() const -> std::string const& { return identifier_; }
    auto set_delegate(std::weak_ptr<RowDelegate> delegate) -> void { delegate_ = std::move(delegate); }

    auto configure(TaskSnapshot const& task) -> void;

    [[nodiscard]] auto text() const -> std::string const& { return text_field_.text(); }
    auto set_text(std::string text) -> void { text_field_.set_text(std::move(text)); }

    [[nodiscard]] auto completed() const -> bool { return completed_; }
    auto set_completed(bool completed) -> void;

    [[nodiscard]] auto editable() const -> bool { return text_field_.editable(); }
    auto set_editable(bool requested) -> void;

    [[nodiscard]] auto background_color() const -> Color::Rgba const&;
    auto set_background_color(Color::Rgba color) -> void;

    auto prepare_for_reuse() -> void;

    auto resize(float width, float height) -> void;
    [[nodiscard]] auto width() const -> float { return width_; }
    [[nodiscard]] auto height() const -> float { return height_; }

    [[nodiscard]] auto accepts_first_mouse() const -> bool { return true; }
    // Puts the text field into edit mode even though it refuses ordinary focus.
    auto become_first_responder() -> bool;

    // Claim rule for horizontal pans: never while this row's text is being
    // edited, and only when the initiating sample is horizontal-dominant.
    [[nodiscard]] auto should_begin_gesture(float dx, float dy) const -> bool;

    auto pointer_down(float x, float y) -> void;
    auto pointer_move(float x, float y) -> void;
    auto pointer_up(float x, float y) -> void;
    auto cancel_pointer() -> void;

    // Pointer samples and focus requests are recorded into trace while set.
    auto set_trace(SwipeTrace* trace) -> void { trace_ = trace; }

    // Entry point for hosts that run their own pan recognizer. translation_x
    // is the cumulative horizontal translation since Began.
    auto handle_pan(PanPhase phase, float translation_x) -> void;

    [[nodiscard]] auto gesture_state() const -> RowGestureState { return gesture_state_; }
    [[nodiscard]] auto recognizer_state() const -> RecognizerState { return recognizer_.state(); }
    [[nodiscard]] auto release_intent() const -> ReleaseIntent { return release_intent_; }
    [[nodiscard]] auto content_offset() const -> float;
    [[nodiscard]] auto alpha() const -> float { return alpha_; }

    [[nodiscard]] auto done_icon() const -> Layer const& { return layers_.layer(LayerKind::DoneIcon); }
    [[nodiscard]] auto delete_icon() const -> Layer const& { return layers_.layer(LayerKind::DeleteIcon); }
    [[nodiscard]] auto overlay() const -> Layer const& { return layers_.layer(LayerKind::Overlay); }
    [[nodiscard]] auto layers() const -> LayerStack const& { return layers_; }

    [[nodiscard]] auto text_field() const -> TaskTextField const& { return text_field_; }
    [[nodiscard]] auto text_field() -> TaskTextField& { return text_field_; }

    [[nodiscard]] auto config() const -> RowConfig const& { return config_; }
    [[nodiscard]] auto geometry() const -> SwipeGeometry const& { return geometry_; }

private:
    auto text_field_did_begin_editing(TaskTextField& field) -> void override;
    auto text_field_did_change_text(TaskTextField& field) -> void override;
    auto text_field_did_end_editing(TaskTextField& field) -> void override;

    auto layout() -> void;
    auto reset_icons() -> void;
    auto apply_drag_feedback(SwipeFeedback const& feedback) -> void;

    auto begin_drag() -> void;
    auto update_drag(float translation_x) -> void;
    auto end_drag() -> void;
    auto settle_complete() -> void;
    auto settle_delete() -> void;
    auto settle_reset() -> void;
    auto toggle_completed() -> void;
    auto supersede_settle() -> void;
    auto notify_completed() -> void;

    auto track(AnimationId id) -> void;
    auto cancel_animations() -> void;

    auto content() -> Layer& { return layers_.layer(LayerKind::Content); }
    auto content() const -> Layer const& { return layers_.layer(LayerKind::Content); }

    std::string identifier_;
    RowHost host_;
    RowConfig config_;
    SwipeGeometry geometry_;
    std::weak_ptr<RowDelegate> delegate_;

    LayerStack layers_;
    TaskTextField text_field_;
    PanGestureRecognizer recognizer_;

    float width_ = 0.0f;
    float height_ = 0.0f;
    float alpha_ = 1.0f;
    bool completed_ = false;
    bool toggle_pending_ = false;

    RowGestureState gesture_state_ = RowGestureState::Idle;
    ReleaseIntent release_intent_ = ReleaseIntent::None;
    std::vector<AnimationId> animations_;
    SwipeTrace* trace_ = nullptr;
};

} // namespace TR::UI
