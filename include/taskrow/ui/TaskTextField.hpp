#pragma once

#include <taskrow/core/Error.hpp>
#include <taskrow/ui/ColorUtils.hpp>
#include <taskrow/ui/FocusScope.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace TR::UI {

class TaskTextField;

class TextFieldDelegate {
public:
    virtual ~TextFieldDelegate() = default;

    virtual auto text_field_did_begin_editing(TaskTextField& field) -> void = 0;
    virtual auto text_field_did_change_text(TaskTextField& field) -> void = 0;
    virtual auto text_field_did_end_editing(TaskTextField& field) -> void = 0;
};

// Number of UTF-8 code points in text; continuation bytes are not counted.
[[nodiscard]] auto CharacterCount(std::string_view text) -> std::size_t;

// Borderless single-row editor. It refuses focus from ordinary clicks; the
// owning row grants it focus through request_focus_override().
class TaskTextField final : public FocusTarget {
public:
    explicit TaskTextField(FocusScope& scope);
    ~TaskTextField() override;

    TaskTextField(TaskTextField const&) = delete;
    TaskTextField& operator=(TaskTextField const&) = delete;

    auto set_delegate(TextFieldDelegate* delegate) -> void { delegate_ = delegate; }

    [[nodiscard]] auto text() const -> std::string const& { return text_; }
    auto set_text(std::string text) -> void;

    // Host-driven edit while focused. Fires text_field_did_change_text.
    auto replace_text(std::string text) -> TR::Expected<void>;

    [[nodiscard]] auto editable() const -> bool { return editable_; }
    auto set_editable(bool editable) -> void { editable_ = editable; }

    [[nodiscard]] auto alpha() const -> float { return alpha_; }
    [[nodiscard]] auto alpha_ref() -> float& { return alpha_; }
    auto set_alpha(float alpha) -> void { alpha_ = alpha; }

    [[nodiscard]] auto text_color() const -> Color::Rgba const& { return text_color_; }
    auto set_text_color(Color::Rgba color) -> void { text_color_ = color; }

    [[nodiscard]] auto font_size() const -> float { return font_size_; }
    auto set_font_size(float size) -> void { font_size_ = size; }

    // Strikes the leading fraction of the characters. A partial strike clears
    // any previous strike first.
    auto strike(float fraction = 1.0f) -> void;
    auto unstrike() -> void;
    [[nodiscard]] auto strike_fraction() const -> float { return strike_fraction_; }
    [[nodiscard]] auto struck_length() const -> std::size_t;
    [[nodiscard]] auto fully_struck() const -> bool;

    [[nodiscard]] auto accepts_first_mouse() const -> bool { return false; }
    [[nodiscard]] auto accepts_first_responder() const -> bool override { return accepts_first_responder_; }
    auto did_become_first_responder() -> void override;
    auto did_resign_first_responder() -> void override;

    // Asks the scope for focus through the normal path; refused unless an
    // override is active.
    auto become_first_responder() -> bool;
    // Permits focus for exactly one acquisition and reverts before returning.
    auto request_focus_override() -> bool;

    [[nodiscard]] auto is_first_responder() const -> bool;
    [[nodiscard]] auto is_editing() const -> bool { return is_first_responder(); }

private:
    FocusScope* scope_ = nullptr;
    TextFieldDelegate* delegate_ = nullptr;
    std::string text_;
    bool editable_ = true;
    bool accepts_first_responder_ = false;
    float alpha_ = 1.0f;
    float strike_fraction_ = 0.0f;
    float font_size_ = 18.0f;
    Color::Rgba text_color_ = Color::White;
};

} // namespace TR::UI
