#include <taskrow/ui/TaskTextField.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>

namespace TR::UI {

auto CharacterCount(std::string_view text) -> std::size_t {
    std::size_t count = 0;
    for (unsigned char ch : text) {
        if ((ch & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

TaskTextField::TaskTextField(FocusScope& scope)
    : scope_(&scope) {}

TaskTextField::~TaskTextField() {
    scope_->forget(*this);
}

auto TaskTextField::set_text(std::string text) -> void {
    text_ = std::move(text);
}

auto TaskTextField::replace_text(std::string text) -> TR::Expected<void> {
    if (!editable_) {
        return std::unexpected{TR::Error{TR::Error::Code::InvalidPermissions, "text field is not editable"}};
    }
    if (!is_first_responder()) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound, "text field is not being edited"}};
    }
    text_ = std::move(text);
    if (delegate_ != nullptr) {
        delegate_->text_field_did_change_text(*this);
    }
    return {};
}

auto TaskTextField::strike(float fraction) -> void {
    fraction = std::clamp(fraction, 0.0f, 1.0f);
    if (fraction < 1.0f) {
        unstrike();
    }
    strike_fraction_ = fraction;
}

auto TaskTextField::unstrike() -> void {
    strike_fraction_ = 0.0f;
}

auto TaskTextField::struck_length() const -> std::size_t {
    auto count = CharacterCount(text_);
    return static_cast<std::size_t>(std::floor(strike_fraction_ * static_cast<float>(count)));
}

auto TaskTextField::fully_struck() const -> bool {
    return strike_fraction_ >= 1.0f;
}

auto TaskTextField::did_become_first_responder() -> void {
    tr_log("Text field became first responder", "TextField");
    if (delegate_ != nullptr) {
        delegate_->text_field_did_begin_editing(*this);
    }
}

auto TaskTextField::did_resign_first_responder() -> void {
    tr_log("Text field resigned first responder", "TextField");
    if (delegate_ != nullptr) {
        delegate_->text_field_did_end_editing(*this);
    }
}

auto TaskTextField::become_first_responder() -> bool {
    return scope_->make_first_responder(this);
}

auto TaskTextField::request_focus_override() -> bool {
    accepts_first_responder_ = true;
    (void)become_first_responder();
    accepts_first_responder_ = false;
    return true;
}

auto TaskTextField::is_first_responder() const -> bool {
    return scope_->first_responder() == this;
}

} // namespace TR::UI
