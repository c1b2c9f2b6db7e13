#pragma once

#include <nodememo/value/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NM {

struct Theme {
    std::string mode;   // "light", "dark", ...; part of every resolution key
    ObjectRef   system; // nested dictionary addressed by "theme.a.b.c" placeholders
};

// True when there is nothing to substitute: no system or an empty one.
[[nodiscard]] auto themeIsEmpty(Theme const& theme) -> bool;

// {mode, system} as an object; the argument handed to theme-aware function leaves.
[[nodiscard]] auto themeAsValue(Theme const& theme) -> Value;

// Walks `path` ("spacing.md") through nested objects of `system`. Any missing
// segment, a non-object along the way or an undefined leaf yields nullopt.
[[nodiscard]] auto lookup_theme_path(ObjectRef const& system, std::string_view path) -> std::optional<Value>;

} // namespace NM
