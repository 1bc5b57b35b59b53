#pragma once

#include <taskrow/core/Error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TR::Tools {

// Minimal `--name value` / `--name=value` parser for the command line tools.
class Cli {
public:
    using ParseError = std::optional<std::string>;

    void set_program_name(std::string_view name);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        bool allow_leading_dash_value = false;
    };

    struct FloatOption {
        std::function<void(float)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_float(std::string_view name, FloatOption option);
    void add_alias(std::string_view alias, std::string_view target);

    // Every problem is reported through the error logger; the first one is
    // also returned as MalformedInput.
    [[nodiscard]] auto parse(int argc, char** argv) -> TR::Expected<void>;

private:
    struct OptionEntry {
        std::string name;
        bool expects_value = false;
        bool allow_leading_dash_value = false;
        std::function<void()> flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    void fail(std::string message);
    [[nodiscard]] bool looks_like_option(std::string_view token) const;

    std::vector<OptionEntry> options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string program_name_;
    std::function<void(std::string const&)> error_logger_;
    std::optional<TR::Error> first_error_;
};

} // namespace TR::Tools
