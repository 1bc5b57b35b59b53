#include "Cli.hpp"

#include <charconv>
#include <cmath>
#include <iostream>

namespace TR::Tools {

void Cli::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void Cli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void Cli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void Cli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.allow_leading_dash_value = option.allow_leading_dash_value;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void Cli::add_float(std::string_view name, FloatOption option) {
    ValueOption value_opt{};
    value_opt.allow_leading_dash_value = true;
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires a numeric value";
        }
        float value = 0.0f;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size() || !std::isfinite(value)) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void Cli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        fail("missing option for alias '" + std::string(target) + "'");
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

auto Cli::parse(int argc, char** argv) -> TR::Expected<void> {
    first_error_.reset();
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            fail("unknown argument '" + std::string(raw_token) + "'");
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                fail(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                fail(entry->name + " requires a value");
                continue;
            }
            std::string_view candidate{argv[i + 1]};
            if (looks_like_option(candidate) && !entry->allow_leading_dash_value) {
                fail(entry->name + " requires a value");
                continue;
            }
            value = candidate;
            ++i;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                fail(*error);
            }
        }
    }
    if (first_error_) {
        return std::unexpected{*first_error_};
    }
    return {};
}

auto Cli::find_option(std::string_view name) -> OptionEntry* {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void Cli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void Cli::fail(std::string message) {
    std::string text = program_name_.empty() ? std::string{"taskrow"} : program_name_;
    text.append(": ");
    text.append(message);
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
    if (!first_error_) {
        first_error_ = TR::Error{TR::Error::Code::MalformedInput, std::move(message)};
    }
}

bool Cli::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-';
}

} // namespace TR::Tools
