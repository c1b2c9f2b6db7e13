#pragma once

#include <nodememo/theme/Theme.hpp>
#include <nodememo/value/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NM {

class ResolutionCache;

struct ResolveOptions {
    // Invoke function leaves with the theme and resolve string results further.
    bool process_functions = false;
};

/**
 * Rewrites `theme.a.b` placeholders in a property graph against a Theme.
 *
 * Copy-on-write: a container is reallocated only when one of its children
 * changed; everything else keeps its identity, including the root when
 * nothing changed at all. Traversal runs on an explicit frame stack, so the
 * depth of the graph is bounded by memory rather than by the call stack.
 * Containers already on the current descent path are left as they are,
 * shared containers are resolved once per call.
 *
 * Placeholders that do not resolve to a scalar (or to an object carrying a
 * scalar `default`) are left in the text verbatim.
 */
class ThemeGraphResolver {
public:
    explicit ThemeGraphResolver(ResolutionCache* cache = nullptr) : cache_(cache) {}

    [[nodiscard]] auto resolve(Value const& graph, Theme const& theme, ResolveOptions const& options = {}) -> Value;

    // Substitutes every placeholder in `text`; nullopt when nothing was replaced.
    [[nodiscard]] auto resolveString(std::string_view text, Theme const& theme) -> std::optional<std::string>;

    [[nodiscard]] static auto containsPlaceholder(std::string_view text) -> bool;

    auto setCache(ResolutionCache* cache) -> void { cache_ = cache; }

private:
    ResolutionCache* cache_;
};

} // namespace NM
