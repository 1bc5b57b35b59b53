#pragma once

namespace TR::UI {

class FocusTarget {
public:
    virtual ~FocusTarget() = default;

    [[nodiscard]] virtual auto accepts_first_responder() const -> bool = 0;
    virtual auto did_become_first_responder() -> void = 0;
    virtual auto did_resign_first_responder() -> void = 0;
};

// The first-responder slot of one host window. Rows in the same window share
// a scope, so focusing one row's text resigns whatever held focus before.
class FocusScope {
public:
    FocusScope() = default;
    FocusScope(FocusScope const&) = delete;
    FocusScope& operator=(FocusScope const&) = delete;

    [[nodiscard]] auto first_responder() const -> FocusTarget* { return first_responder_; }

    // Passing nullptr resigns the current responder. Returns false when the
    // target refuses focus; the previous responder is kept in that case.
    auto make_first_responder(FocusTarget* target) -> bool;

    auto clear() -> void { (void)make_first_responder(nullptr); }

    // Drops the target without notifying it; called from FocusTarget destructors.
    auto forget(FocusTarget const& target) -> void;

private:
    auto switch_to(FocusTarget* target) -> void;

    FocusTarget* first_responder_ = nullptr;
};

} // namespace TR::UI
