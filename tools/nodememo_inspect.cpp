#include <nodememo/NodeMemo.hpp>

#include "cli/ArgParser.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

struct InspectOptions {
    std::optional<std::filesystem::path> encodePath;
    std::optional<std::filesystem::path> resolvePath;
    std::optional<std::filesystem::path> themePath;
    std::optional<std::filesystem::path> optionsPath;
    std::string                          mode   = "light";
    int                                  indent = 2;
    bool                                 hash   = false;
    bool                                 help   = false;
};

void print_usage() {
    std::cout << "Usage: nodememo_inspect [options]\n"
                 "Options:\n"
                 "  --encode <file.json>       Print the canonical signature of a props document\n"
                 "  --hash                     With --encode, also print the hashed signature\n"
                 "  --resolve <file.json>      Resolve theme placeholders in a props document\n"
                 "  --theme <file.json>        Theme system used by --resolve\n"
                 "  --mode <name>              Theme mode (default light)\n"
                 "  --options <file.json>      Cache options (defaults plus NODEMEMO_* overrides otherwise)\n"
                 "  --indent <n>               JSON indent for resolved output (default 2, -1 for compact)\n"
                 "  --help                     Show this message\n";
}

auto path_option(std::optional<std::filesystem::path>& target, std::string_view name) -> NM::Tools::ArgParser::ValueOption {
    return {.on_value = [&target, name](std::string_view value) -> NM::Tools::ArgParser::ParseError {
        if (value.empty()) {
            return std::string{name} + " requires a file";
        }
        target = std::filesystem::path(std::string{value});
        return std::nullopt;
    }};
}

auto parse_cli(int argc, char** argv) -> std::optional<InspectOptions> {
    using NM::Tools::ArgParser;
    InspectOptions options;

    ArgParser cli{"nodememo_inspect"};
    cli.add_value("--encode", path_option(options.encodePath, "--encode"));
    cli.add_value("--resolve", path_option(options.resolvePath, "--resolve"));
    cli.add_value("--theme", path_option(options.themePath, "--theme"));
    cli.add_value("--options", path_option(options.optionsPath, "--options"));
    cli.add_value("--mode", {.on_value = [&](std::string_view value) -> ArgParser::ParseError {
                      if (value.empty()) {
                          return std::string{"--mode requires a name"};
                      }
                      options.mode.assign(value.begin(), value.end());
                      return std::nullopt;
                  }});
    cli.add_value("--indent", {.on_value = [&](std::string_view value) -> ArgParser::ParseError {
                      int  indent = 0;
                      auto result = std::from_chars(value.data(), value.data() + value.size(), indent);
                      if (result.ec != std::errc{} || result.ptr != value.data() + value.size()) {
                          return std::string{"--indent must be numeric"};
                      }
                      options.indent = indent;
                      return std::nullopt;
                  }});
    cli.add_flag("--hash", {.on_set = [&] { options.hash = true; }});
    cli.add_flag("--help", {.on_set = [&] { options.help = true; }});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        for (auto const& error : cli.errors()) {
            std::cerr << error << "\n";
        }
        return std::nullopt;
    }
    if (!cli.positionals().empty()) {
        std::cerr << "nodememo_inspect: unexpected argument '" << cli.positionals().front() << "'\n";
        return std::nullopt;
    }
    return options;
}

auto read_file(std::filesystem::path const& path) -> NM::Expected<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return std::unexpected(NM::make_error("cannot open '" + path.string() + "'", NM::Error::Code::NotFound));
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

auto read_value(std::filesystem::path const& path) -> NM::Expected<NM::Value> {
    auto text = read_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return NM::Encoding::decode(*text);
}

auto load_options(std::optional<std::filesystem::path> const& path) -> std::optional<NM::CacheOptions> {
    if (path) {
        auto text = read_file(*path);
        if (!text) {
            std::cerr << "Options: " << NM::describeError(text.error()) << std::endl;
            return std::nullopt;
        }
        auto loaded = NM::LoadCacheOptionsJson(*text);
        if (!loaded) {
            std::cerr << "Options: " << NM::describeError(loaded.error()) << std::endl;
            return std::nullopt;
        }
        return *loaded;
    }

    NM::CacheOptions options;
    if (!NM::ApplyCacheEnvOverrides(options)) {
        return std::nullopt;
    }
    if (auto error = NM::ValidateCacheOptions(options)) {
        std::cerr << "Options: " << *error << std::endl;
        return std::nullopt;
    }
    return options;
}

auto run_encode(InspectOptions const& options) -> int {
    auto value = read_value(*options.encodePath);
    if (!value) {
        std::cerr << "Encode failed: " << NM::describeError(value.error()) << std::endl;
        return EXIT_FAILURE;
    }
    auto signature = NM::Encoding::encode(*value);
    std::cout << signature << std::endl;
    if (options.hash) {
        std::cout << NM::Encoding::hashString(signature) << std::endl;
    }
    return EXIT_SUCCESS;
}

auto run_resolve(InspectOptions const& options) -> int {
    auto cacheOptions = load_options(options.optionsPath);
    if (!cacheOptions) {
        return EXIT_FAILURE;
    }
    auto props = read_value(*options.resolvePath);
    if (!props) {
        std::cerr << "Resolve failed: " << NM::describeError(props.error()) << std::endl;
        return EXIT_FAILURE;
    }

    NM::Theme theme{options.mode, nullptr};
    if (options.themePath) {
        auto system = read_value(*options.themePath);
        if (!system) {
            std::cerr << "Theme: " << NM::describeError(system.error()) << std::endl;
            return EXIT_FAILURE;
        }
        if (!system->isObject()) {
            std::cerr << "Theme: expected a JSON object" << std::endl;
            return EXIT_FAILURE;
        }
        theme.system = system->asObject();
    }

    NM::CacheContext context{*cacheOptions};
    auto             resolved = context.resolver().resolve(*props, theme);
    std::cout << NM::Encoding::encode(resolved, {.indent = options.indent}) << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_cli(argc, argv);
    if (!options) {
        print_usage();
        return EXIT_FAILURE;
    }
    if (options->help || (!options->encodePath && !options->resolvePath)) {
        print_usage();
        return options->help ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (options->encodePath && options->resolvePath) {
        std::cerr << "nodememo_inspect: --encode and --resolve are exclusive" << std::endl;
        return EXIT_FAILURE;
    }
    return options->encodePath ? run_encode(*options) : run_resolve(*options);
}
