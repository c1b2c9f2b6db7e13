#include "ArgParser.hpp"

#include <utility>

namespace NM::Tools {

ArgParser::ArgParser(std::string programName)
    : programName_(std::move(programName)) {}

void ArgParser::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void ArgParser::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void ArgParser::add_alias(std::string_view alias, std::string_view target) {
    auto it = lookup_.find(std::string(target));
    if (it == lookup_.end()) {
        fail("missing option for alias '" + std::string(alias) + "'");
        return;
    }
    lookup_.emplace(std::string(alias), it->second);
}

bool ArgParser::parse(int argc, char const* const* argv) {
    errors_.clear();
    positionals_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};
        if (token.size() < 2 || token.front() != '-') {
            positionals_.emplace_back(token);
            continue;
        }

        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* entry = find_option(name);
        if (entry == nullptr) {
            fail("unknown flag '" + std::string(token) + "'");
            continue;
        }

        if (!entry->expects_value) {
            if (attached) {
                fail(entry->name + " does not accept a value");
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached) {
            value = *attached;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            fail(entry->name + " requires a value");
            continue;
        }
        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                fail(*error);
            }
        }
    }
    return errors_.empty();
}

auto ArgParser::find_option(std::string_view name) -> OptionEntry* {
    auto it = lookup_.find(std::string(name));
    if (it == lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void ArgParser::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    lookup_.emplace(options_.back().name, options_.size() - 1);
}

void ArgParser::fail(std::string_view message) {
    std::string text = programName_;
    text.append(": ");
    text.append(message.begin(), message.end());
    errors_.push_back(std::move(text));
}

} // namespace NM::Tools
