#pragma once

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NM::Tools {

// Small "--name value" / "--name=value" parser for the command line tools.
class ArgParser {
public:
    using ParseError = std::optional<std::string>;

    explicit ArgParser(std::string programName);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_alias(std::string_view alias, std::string_view target);

    // Tokens that are not options are collected as positionals.
    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return positionals_; }
    [[nodiscard]] auto errors() const -> std::vector<std::string> const& { return errors_; }

private:
    struct OptionEntry {
        std::string                                  name;
        bool                                         expects_value = false;
        std::function<void()>                        flag_handler;
        std::function<ParseError(std::string_view)>  value_handler;
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    void fail(std::string_view message);

    std::string                                       programName_;
    std::vector<OptionEntry>                          options_;
    phmap::flat_hash_map<std::string, std::size_t>    lookup_;
    std::vector<std::string>                          positionals_;
    std::vector<std::string>                          errors_;
};

} // namespace NM::Tools
