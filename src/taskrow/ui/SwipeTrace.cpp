#include <taskrow/ui/SwipeTrace.hpp>
#include <taskrow/ui/SettleAnimator.hpp>
#include <taskrow/ui/SwipeableRow.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace TR::UI {

namespace {

auto parse_float(std::string_view value, float fallback) -> float {
    float parsed = 0.0f;
    auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
        return fallback;
    }
    return parsed;
}

} // namespace

SwipeTrace::SwipeTrace(SwipeTraceOptions options)
    : options_(std::move(options)) {}

auto SwipeTrace::init_from_env() -> TR::Expected<void> {
    recorded_events_.clear();
    start_time_valid_ = false;
    record_enabled_ = false;

    if (replay_enabled_) {
        return {};
    }
    if (auto const* replay = std::getenv(options_.replay_env.c_str()); replay && replay[0] != '\0') {
        return enable_replay(replay);
    }
    if (auto const* record = std::getenv(options_.record_env.c_str()); record && record[0] != '\0') {
        enable_recording(record);
    }
    return {};
}

auto SwipeTrace::enable_recording(std::filesystem::path path) -> void {
    record_enabled_ = true;
    replay_enabled_ = false;
    record_path_ = std::move(path);
    replay_path_.clear();
    start_time_valid_ = false;
    recorded_events_.clear();
    replay_events_.clear();
}

auto SwipeTrace::enable_replay(std::filesystem::path path) -> TR::Expected<void> {
    record_enabled_ = false;
    record_path_.clear();
    recorded_events_.clear();

    auto events = LoadSwipeTrace(path);
    if (!events) {
        replay_enabled_ = false;
        replay_events_.clear();
        return std::unexpected{events.error()};
    }
    replay_enabled_ = true;
    replay_path_ = std::move(path);
    replay_events_ = std::move(*events);
    return {};
}

auto SwipeTrace::record(SwipeTraceEventKind kind, float x, float y) -> void {
    if (!record_enabled_) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (!start_time_valid_) {
        start_time_ = now;
        start_time_valid_ = true;
    }
    SwipeTraceEvent event{};
    event.kind = kind;
    event.x = x;
    event.y = y;
    event.time_ms = std::chrono::duration<double, std::milli>(now - start_time_).count();
    recorded_events_.push_back(event);
}

auto SwipeTrace::flush() -> TR::Expected<std::size_t> {
    if (!record_enabled_) {
        return std::size_t{0};
    }
    std::error_code ec;
    if (record_path_.has_parent_path()) {
        std::filesystem::create_directories(record_path_.parent_path(), ec);
        if (ec) {
            return std::unexpected{TR::Error{TR::Error::Code::NotFound,
                                             "failed to create '" + record_path_.parent_path().string() + "': " + ec.message()}};
        }
    }
    std::ofstream output(record_path_);
    if (!output) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound,
                                         "failed to open trace output '" + record_path_.string() + "'"}};
    }
    for (auto const& event : recorded_events_) {
        output << FormatEvent(event) << '\n';
    }
    output.flush();
    tr_log("Captured " + std::to_string(recorded_events_.size()) + " swipe events to " + record_path_.string(), "Trace");
    return recorded_events_.size();
}

auto SwipeTrace::KindToString(SwipeTraceEventKind kind) -> std::string_view {
    switch (kind) {
    case SwipeTraceEventKind::PointerDown:
        return "pointer_down";
    case SwipeTraceEventKind::PointerMove:
        return "pointer_move";
    case SwipeTraceEventKind::PointerUp:
        return "pointer_up";
    case SwipeTraceEventKind::PointerCancel:
        return "pointer_cancel";
    case SwipeTraceEventKind::FocusRequest:
        return "focus_request";
    }
    return "unknown";
}

auto SwipeTrace::StringToKind(std::string_view value) -> std::optional<SwipeTraceEventKind> {
    for (auto kind : {SwipeTraceEventKind::PointerDown,
                      SwipeTraceEventKind::PointerMove,
                      SwipeTraceEventKind::PointerUp,
                      SwipeTraceEventKind::PointerCancel,
                      SwipeTraceEventKind::FocusRequest}) {
        if (KindToString(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

auto SwipeTrace::FormatEvent(SwipeTraceEvent const& event) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << event.time_ms
        << " event=" << KindToString(event.kind)
        << std::setprecision(2)
        << " x=" << event.x
        << " y=" << event.y;
    return oss.str();
}

auto SwipeTrace::ParseLine(std::string const& line) -> std::optional<SwipeTraceEvent> {
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    std::istringstream iss(line);
    SwipeTraceEvent event{};
    if (!(iss >> event.time_ms)) {
        return std::nullopt;
    }
    bool has_kind = false;
    std::string token;
    while (iss >> token) {
        auto pos = token.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        auto key = std::string_view{token}.substr(0, pos);
        auto value = std::string_view{token}.substr(pos + 1);
        if (key == "event") {
            if (auto kind = StringToKind(value)) {
                event.kind = *kind;
                has_kind = true;
            }
        } else if (key == "x") {
            event.x = parse_float(value, event.x);
        } else if (key == "y") {
            event.y = parse_float(value, event.y);
        }
    }
    if (!has_kind) {
        return std::nullopt;
    }
    return event;
}

auto LoadSwipeTrace(std::filesystem::path const& path) -> TR::Expected<std::vector<SwipeTraceEvent>> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound, "swipe trace '" + path.string() + "' does not exist"}};
    }
    std::ifstream input(path);
    if (!input) {
        return std::unexpected{TR::Error{TR::Error::Code::NotFound, "failed to open swipe trace '" + path.string() + "'"}};
    }
    std::vector<SwipeTraceEvent> events;
    std::string line;
    while (std::getline(input, line)) {
        if (auto parsed = SwipeTrace::ParseLine(line)) {
            events.push_back(*parsed);
        }
    }
    if (events.empty()) {
        return std::unexpected{TR::Error{TR::Error::Code::MalformedInput, "swipe trace '" + path.string() + "' contained no events"}};
    }
    return events;
}

auto ReplaySwipeTrace(std::span<SwipeTraceEvent const> events,
                      SwipeableRow& row,
                      SettleAnimator& animator) -> void {
    double previous_ms = events.empty() ? 0.0 : events.front().time_ms;
    for (auto const& event : events) {
        auto gap = std::max(0.0, event.time_ms - previous_ms);
        previous_ms = event.time_ms;
        if (gap > 0.0) {
            animator.advance(std::chrono::milliseconds{static_cast<std::int64_t>(std::lround(gap))});
        }
        switch (event.kind) {
        case SwipeTraceEventKind::PointerDown:
            row.pointer_down(event.x, event.y);
            break;
        case SwipeTraceEventKind::PointerMove:
            row.pointer_move(event.x, event.y);
            break;
        case SwipeTraceEventKind::PointerUp:
            row.pointer_up(event.x, event.y);
            break;
        case SwipeTraceEventKind::PointerCancel:
            row.cancel_pointer();
            break;
        case SwipeTraceEventKind::FocusRequest:
            (void)row.become_first_responder();
            break;
        }
    }
}

} // namespace TR::UI
