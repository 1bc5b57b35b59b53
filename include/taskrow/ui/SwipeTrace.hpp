#pragma once

#include <taskrow/core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TR::UI {

class SettleAnimator;
class SwipeableRow;

enum class SwipeTraceEventKind {
    PointerDown,
    PointerMove,
    PointerUp,
    PointerCancel,
    FocusRequest,
};

struct SwipeTraceEvent {
    SwipeTraceEventKind kind = SwipeTraceEventKind::PointerMove;
    double time_ms = 0.0;
    float x = 0.0f;
    float y = 0.0f;
};

struct SwipeTraceOptions {
    std::string record_env = "TASKROW_SWIPE_TRACE_RECORD";
    std::string replay_env = "TASKROW_SWIPE_TRACE_REPLAY";
};

// Records the pointer samples a row receives, or loads a recorded file for
// replay. Recording and replay are mutually exclusive.
class SwipeTrace {
public:
    explicit SwipeTrace(SwipeTraceOptions options = {});

    auto init_from_env() -> TR::Expected<void>;
    auto enable_recording(std::filesystem::path path) -> void;
    auto enable_replay(std::filesystem::path path) -> TR::Expected<void>;

    auto record(SwipeTraceEventKind kind, float x = 0.0f, float y = 0.0f) -> void;
    auto flush() -> TR::Expected<std::size_t>;

    [[nodiscard]] auto recording() const -> bool { return record_enabled_; }
    [[nodiscard]] auto replaying() const -> bool { return replay_enabled_; }
    [[nodiscard]] auto record_path() const -> std::filesystem::path const& { return record_path_; }
    [[nodiscard]] auto recorded() const -> std::vector<SwipeTraceEvent> const& { return recorded_events_; }
    [[nodiscard]] auto events() const -> std::vector<SwipeTraceEvent> const& { return replay_events_; }

    [[nodiscard]] static auto KindToString(SwipeTraceEventKind kind) -> std::string_view;
    [[nodiscard]] static auto StringToKind(std::string_view value) -> std::optional<SwipeTraceEventKind>;
    [[nodiscard]] static auto FormatEvent(SwipeTraceEvent const& event) -> std::string;
    [[nodiscard]] static auto ParseLine(std::string const& line) -> std::optional<SwipeTraceEvent>;

private:
    SwipeTraceOptions options_{};
    bool record_enabled_ = false;
    bool replay_enabled_ = false;
    bool start_time_valid_ = false;
    std::filesystem::path record_path_;
    std::filesystem::path replay_path_;
    std::vector<SwipeTraceEvent> recorded_events_;
    std::vector<SwipeTraceEvent> replay_events_;
    std::chrono::steady_clock::time_point start_time_{};
};

auto LoadSwipeTrace(std::filesystem::path const& path) -> TR::Expected<std::vector<SwipeTraceEvent>>;

// Feeds recorded events to a row, advancing the animator by the recorded
// gaps between events. Animations still running at the end are left running.
auto ReplaySwipeTrace(std::span<SwipeTraceEvent const> events,
                      SwipeableRow& row,
                      SettleAnimator& animator) -> void;

} // namespace TR::UI
