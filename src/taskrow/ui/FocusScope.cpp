#include <taskrow/ui/FocusScope.hpp>

namespace TR::UI {

auto FocusScope::make_first_responder(FocusTarget* target) -> bool {
    if (target == first_responder_) {
        return true;
    }
    if (target != nullptr && !target->accepts_first_responder()) {
        return false;
    }
    switch_to(target);
    return true;
}

auto FocusScope::forget(FocusTarget const& target) -> void {
    if (first_responder_ == &target) {
        first_responder_ = nullptr;
    }
}

auto FocusScope::switch_to(FocusTarget* target) -> void {
    auto* previous = first_responder_;
    first_responder_ = target;
    if (previous != nullptr) {
        previous->did_resign_first_responder();
    }
    if (target != nullptr) {
        target->did_become_first_responder();
    }
}

} // namespace TR::UI
