#include <nodememo/theme/Theme.hpp>

namespace NM {

auto themeIsEmpty(Theme const& theme) -> bool {
    return !theme.system || theme.system->empty();
}

auto themeAsValue(Theme const& theme) -> Value {
    return makeObject({{"mode", theme.mode}, {"system", theme.system ? Value{theme.system} : Value{}}});
}

auto lookup_theme_path(ObjectRef const& system, std::string_view path) -> std::optional<Value> {
    if (!system || path.empty()) {
        return std::nullopt;
    }
    Value current{system};
    while (true) {
        auto const  dot     = path.find('.');
        auto const  segment = path.substr(0, dot);
        auto const* object  = current.getIf<ObjectRef>();
        if (object == nullptr || !*object) {
            return std::nullopt;
        }
        auto const* child = (*object)->find(segment);
        if (child == nullptr || child->isUndefined()) {
            return std::nullopt;
        }
        current = *child;
        if (dot == std::string_view::npos) {
            return current;
        }
        path.remove_prefix(dot + 1);
    }
}

} // namespace NM
