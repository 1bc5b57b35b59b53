#include "tools/Cli.hpp"
#include "utils/TaggedLogger.hpp"

#include <taskrow/ui/FocusScope.hpp>
#include <taskrow/ui/RowConfig.hpp>
#include <taskrow/ui/RowDiagnosticsJson.hpp>
#include <taskrow/ui/RowDrawList.hpp>
#include <taskrow/ui/SettleAnimator.hpp>
#include <taskrow/ui/SwipeTrace.hpp>
#include <taskrow/ui/SwipeableRow.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct ReplayOptions {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> trace_path;
    std::string text = "Swipe me";
    bool completed = false;
    std::optional<float> width;
    float drag = 0.0f;
    bool dump_draw_list = false;
    bool show_help = false;
};

void print_usage() {
    std::cout << "Usage: taskrow_swipe_replay [options]\n"
                 "Options:\n"
                 "  --config <file>     Row configuration JSON (default: $TASKROW_CONFIG or built-in)\n"
                 "  --text <s>          Task text (default \"Swipe me\")\n"
                 "  --completed         Start the row in the completed state\n"
                 "  --width <px>        Row width (default from config)\n"
                 "  --trace <file>      Replay a recorded swipe trace\n"
                 "  --drag <dx>         Synthesize one horizontal drag of dx points\n"
                 "  --dump-draw-list    Include the final draw list in the output\n"
                 "  --help              Show this message\n";
}

class RecordingDelegate final : public TR::UI::RowDelegate {
public:
    auto row_did_complete(TR::UI::SwipeableRow& row, bool completed) -> void override {
        calls.push_back({{"call", "row_did_complete"}, {"row", row.identifier()}, {"completed", completed}});
    }
    auto row_did_request_delete(TR::UI::SwipeableRow& row) -> void override {
        calls.push_back({{"call", "row_did_request_delete"}, {"row", row.identifier()}});
    }
    auto row_did_begin_editing(TR::UI::SwipeableRow& row) -> void override {
        calls.push_back({{"call", "row_did_begin_editing"}, {"row", row.identifier()}});
    }
    auto row_did_change_text(TR::UI::SwipeableRow& row) -> void override {
        calls.push_back({{"call", "row_did_change_text"}, {"row", row.identifier()}, {"text", row.text()}});
    }
    auto row_did_end_editing(TR::UI::SwipeableRow& row) -> void override {
        calls.push_back({{"call", "row_did_end_editing"}, {"row", row.identifier()}});
    }

    nlohmann::json calls = nlohmann::json::array();
};

auto synthesize_drag(TR::UI::SwipeableRow& row, TR::UI::SettleAnimator& animator, float dx) -> void {
    constexpr int kSteps = 8;
    float const y = row.height() * 0.5f;
    float const start_x = row.width() * 0.5f;
    row.pointer_down(start_x, y);
    for (int step = 1; step <= kSteps; ++step) {
        animator.advance(std::chrono::milliseconds{16});
        row.pointer_move(start_x + dx * static_cast<float>(step) / kSteps, y);
    }
    row.pointer_up(start_x + dx, y);
}

} // namespace

int main(int argc, char** argv) {
    ReplayOptions options;

    TR::Tools::Cli cli;
    cli.set_program_name("taskrow_swipe_replay");
    cli.add_value("--config", {.on_value = [&](std::string_view value) -> TR::Tools::Cli::ParseError {
                      options.config_path = std::filesystem::path{std::string(value)};
                      return std::nullopt;
                  }});
    cli.add_value("--text", {.on_value = [&](std::string_view value) -> TR::Tools::Cli::ParseError {
                      options.text.assign(value.begin(), value.end());
                      return std::nullopt;
                  }});
    cli.add_flag("--completed", {.on_set = [&] { options.completed = true; }});
    cli.add_float("--width", {.on_value = [&](float value) { options.width = value; }});
    cli.add_value("--trace", {.on_value = [&](std::string_view value) -> TR::Tools::Cli::ParseError {
                      options.trace_path = std::filesystem::path{std::string(value)};
                      return std::nullopt;
                  }});
    cli.add_float("--drag", {.on_value = [&](float value) { options.drag = value; }});
    cli.add_flag("--dump-draw-list", {.on_set = [&] { options.dump_draw_list = true; }});
    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");

    if (auto parsed = cli.parse(argc, argv); !parsed) {
        std::cerr << "taskrow_swipe_replay: " << TR::describeError(parsed.error()) << '\n';
        print_usage();
        return 1;
    }
    if (options.show_help) {
        print_usage();
        return 0;
    }
    if (options.width && *options.width <= 0.0f) {
        std::cerr << "taskrow_swipe_replay: --width must be positive\n";
        return 1;
    }

#ifdef TR_LOG_DEBUG
    TR::set_thread_name("Main");
    if (auto const* env_log = std::getenv("TASKROW_LOG"); env_log && std::string_view{env_log} != "0") {
        TR::set_logging_enabled(true);
    }
#endif

    auto config = options.config_path ? TR::UI::LoadRowConfig(*options.config_path) : TR::UI::RowConfigFromEnv();
    if (!config) {
        std::cerr << "taskrow_swipe_replay: " << TR::describeError(config.error()) << '\n';
        return 1;
    }

    TR::UI::SwipeTrace trace;
    if (auto env = trace.init_from_env(); !env) {
        std::cerr << "taskrow_swipe_replay: " << TR::describeError(env.error()) << '\n';
        return 1;
    }
    if (options.trace_path) {
        if (auto replay = trace.enable_replay(*options.trace_path); !replay) {
            std::cerr << "taskrow_swipe_replay: " << TR::describeError(replay.error()) << '\n';
            return 1;
        }
    }

    TR::UI::FocusScope focus;
    TR::UI::SettleAnimator animator;
    auto delegate = std::make_shared<RecordingDelegate>();

    TR::UI::SwipeableRow row{"replay", TR::UI::RowHost{focus, animator}, *config};
    row.set_delegate(delegate);
    row.configure(TR::UI::TaskSnapshot{options.text, options.completed});
    if (options.width) {
        row.resize(*options.width, row.height());
    }
    if (trace.recording()) {
        row.set_trace(&trace);
    }

    if (trace.replaying()) {
        TR::UI::ReplaySwipeTrace(trace.events(), row, animator);
    } else if (options.drag != 0.0f) {
        synthesize_drag(row, animator, options.drag);
    }
    if (!animator.finish_all()) {
        std::cerr << "taskrow_swipe_replay: animations did not settle\n";
        return 1;
    }

    if (trace.recording()) {
        if (auto written = trace.flush(); !written) {
            std::cerr << "taskrow_swipe_replay: " << TR::describeError(written.error()) << '\n';
            return 1;
        }
    }

    nlohmann::json output{{"delegate_calls", delegate->calls},
                          {"row", TR::UI::Diagnostics::row_snapshot_to_json(row)}};
    if (options.dump_draw_list) {
        output["draw_list"] = TR::UI::Diagnostics::draw_list_to_json(TR::UI::BuildRowDrawList(row));
    }
    std::cout << output.dump(2) << '\n';
#ifdef TR_LOG_DEBUG
    TR::logger().flush();
#endif
    return 0;
}
