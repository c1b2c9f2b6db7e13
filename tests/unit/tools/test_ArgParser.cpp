#include <doctest/doctest.h>

#include "cli/ArgParser.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using NM::Tools::ArgParser;

TEST_SUITE("tools.arg_parser") {

TEST_CASE("values, attached values, flags and aliases") {
    std::optional<std::string> theme;
    std::optional<std::string> mode;
    bool                       help = false;

    ArgParser cli{"inspect"};
    cli.add_value("--theme", {.on_value = [&](std::string_view v) -> ArgParser::ParseError {
                      theme = std::string{v};
                      return std::nullopt;
                  }});
    cli.add_value("--mode", {.on_value = [&](std::string_view v) -> ArgParser::ParseError {
                      mode = std::string{v};
                      return std::nullopt;
                  }});
    cli.add_flag("--help", {.on_set = [&] { help = true; }});
    cli.add_alias("-h", "--help");

    std::array<char const*, 5> argv{"inspect", "--theme", "theme.json", "--mode=dark", "-h"};
    REQUIRE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(theme == "theme.json");
    CHECK(mode == "dark");
    CHECK(help);
    CHECK(cli.positionals().empty());
}

TEST_CASE("errors are collected with the program name") {
    ArgParser cli{"inspect"};
    cli.add_value("--indent", {.on_value = [](std::string_view v) -> ArgParser::ParseError {
                      if (v != "2") {
                          return std::string{"--indent must be numeric"};
                      }
                      return std::nullopt;
                  }});
    cli.add_flag("--hash", {});

    std::array<char const*, 6> argv{"inspect", "--indent", "x", "--hash=1", "--bogus", "--indent"};
    CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    REQUIRE(cli.errors().size() == 4);
    CHECK(cli.errors()[0] == "inspect: --indent must be numeric");
    CHECK(cli.errors()[1] == "inspect: --hash does not accept a value");
    CHECK(cli.errors()[2] == "inspect: unknown flag '--bogus'");
    CHECK(cli.errors()[3] == "inspect: --indent requires a value");
}

TEST_CASE("non-option tokens are positionals") {
    ArgParser                  cli{"inspect"};
    std::array<char const*, 3> argv{"inspect", "props.json", "-"};
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(cli.positionals() == std::vector<std::string>{"props.json", "-"});
}

} // TEST_SUITE
