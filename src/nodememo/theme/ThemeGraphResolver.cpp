#include <nodememo/theme/ThemeGraphResolver.hpp>

#include <nodememo/cache/ResolutionCache.hpp>
#include <nodememo/encode/CanonicalEncoder.hpp>

#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <exception>
#include <vector>

namespace NM {

namespace {

constexpr std::string_view kPlaceholderPrefix = "theme.";

auto is_path_char(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '.'
           || ch == '-';
}

// Text substituted for a resolved theme value. Objects contribute their
// `default` member; anything else non-scalar is an invalid theme path.
auto placeholder_text(Value const& value, std::string_view path, bool allowDefault = true)
    -> std::optional<std::string> {
    switch (value.kind()) {
    case ValueKind::Undefined:
    case ValueKind::Null:
        return std::nullopt;
    case ValueKind::String:
        return value.asString();
    case ValueKind::Number:
        return formatNumber(value.asNumber());
    case ValueKind::Boolean:
        return std::string{value.asBool() ? "true" : "false"};
    case ValueKind::BigInt:
        return value.getIf<BigInt>()->digits;
    case ValueKind::Object:
        if (allowDefault) {
            if (auto const* fallback = value.asObject()->find("default")) {
                return placeholder_text(*fallback, path, false);
            }
        }
        break;
    default:
        break;
    }
    nm_log(describeError(make_error("theme." + std::string{path} + " resolves to a "
                                        + std::string{kindName(value.kind())} + ", leaving the placeholder in place",
                                    Error::Code::InvalidThemePath)),
           "ThemeResolver", "WARN");
    return std::nullopt;
}

class Resolution {
public:
    Resolution(ResolutionCache* cache, Theme const& theme, ResolveOptions const& options)
        : cache_(cache), theme_(theme), options_(options) {}

    auto run(Value const& root) -> Value {
        std::vector<Frame>                stack;
        phmap::flat_hash_set<void const*> onPath;
        stack.push_back(Frame{root, false});

        while (!stack.empty()) {
            auto const id = stack.back().node.identity();
            if (resolved_.contains(id)) {
                stack.pop_back();
                continue;
            }

            if (!stack.back().childrenQueued) {
                stack.back().childrenQueued = true;
                onPath.insert(id);
                Value node = stack.back().node;

                auto queue = [&](Value const& child) {
                    if (child.isContainer() && child.identity() != nullptr && !onPath.contains(child.identity())) {
                        stack.push_back(Frame{child, false});
                    }
                };
                if (node.isObject()) {
                    auto const& entries = node.asObject()->entries;
                    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
                        queue(it->second);
                    }
                } else {
                    auto const& items = node.asArray()->items;
                    for (auto it = items.rbegin(); it != items.rend(); ++it) {
                        queue(*it);
                    }
                }
            } else {
                Value node = std::move(stack.back().node);
                stack.pop_back();
                onPath.erase(id);
                resolved_.emplace(id, rebuild(node));
            }
        }

        if (auto it = resolved_.find(root.identity()); it != resolved_.end()) {
            return it->second;
        }
        return root;
    }

    auto substitute(std::string_view text) -> std::optional<std::string> {
        std::string out;
        bool        changed = false;
        std::size_t cursor  = 0;

        while (true) {
            auto const at = text.find(kPlaceholderPrefix, cursor);
            if (at == std::string_view::npos) {
                break;
            }
            auto const start = at + kPlaceholderPrefix.size();
            auto       end   = start;
            while (end < text.size() && is_path_char(text[end])) {
                ++end;
            }
            out.append(text.substr(cursor, at - cursor));
            if (end == start) {
                out.append(kPlaceholderPrefix);
                cursor = start;
                continue;
            }

            auto const path = text.substr(start, end - start);
            std::optional<std::string> replacement;
            if (auto found = lookup(path)) {
                replacement = placeholder_text(*found, path);
            }
            if (replacement) {
                out.append(*replacement);
                changed = true;
            } else {
                out.append(text.substr(at, end - at));
            }
            cursor = end;
        }

        if (!changed) {
            return std::nullopt;
        }
        out.append(text.substr(cursor));
        return out;
    }

private:
    struct Frame {
        Value node;
        bool  childrenQueued;
    };

    auto lookup(std::string_view path) -> std::optional<Value> {
        if (cache_ == nullptr) {
            return lookup_theme_path(theme_.system, path);
        }
        if (!systemSignature_) {
            systemSignature_ = Encoding::encode(Value{theme_.system});
        }
        auto const key = ResolutionCache::pathLookupKey(*systemSignature_, path);
        if (auto hit = cache_->getPathLookup(key)) {
            return hit->value;
        }
        auto found = lookup_theme_path(theme_.system, path);
        cache_->setPathLookup(key, PathLookup{found});
        return found;
    }

    // The replacement for a leaf, or nullopt when it stays as it is.
    auto resolve_leaf(Value const& leaf) -> std::optional<Value> {
        if (leaf.isFunction() && options_.process_functions) {
            try {
                if (!themeValue_) {
                    themeValue_ = themeAsValue(theme_);
                }
                Value produced = leaf.asFunction()->invoke(*themeValue_);
                if (produced.isString() && ThemeGraphResolver::containsPlaceholder(produced.asString())) {
                    if (auto text = substitute(produced.asString())) {
                        return Value{std::move(*text)};
                    }
                }
                return produced;
            } catch (std::exception const& ex) {
                nm_log("Theme function '" + leaf.asFunction()->name + "' threw: " + ex.what(), "ThemeResolver", "WARN");
                return std::nullopt;
            }
        }
        if (leaf.isString() && ThemeGraphResolver::containsPlaceholder(leaf.asString())) {
            if (auto text = substitute(leaf.asString())) {
                return Value{std::move(*text)};
            }
        }
        return std::nullopt;
    }

    auto replacement_for(Value const& child) -> std::optional<Value> {
        if (child.isContainer()) {
            // A null container reference is a null value and stays as it is.
            if (child.identity() == nullptr) {
                return std::nullopt;
            }
            if (auto it = resolved_.find(child.identity()); it != resolved_.end()
                                                             && !Value::same(it->second, child)) {
                return it->second;
            }
            return std::nullopt;
        }
        return resolve_leaf(child);
    }

    auto rebuild(Value const& node) -> Value {
        if (node.isObject()) {
            auto const& source = node.asObject();
            ObjectRef   copy;
            for (std::size_t i = 0; i < source->entries.size(); ++i) {
                if (auto next = replacement_for(source->entries[i].second)) {
                    if (!copy) {
                        copy = std::make_shared<Object>(*source);
                    }
                    copy->entries[i].second = std::move(*next);
                }
            }
            return copy ? Value{copy} : node;
        }

        auto const& source = node.asArray();
        ArrayRef    copy;
        for (std::size_t i = 0; i < source->items.size(); ++i) {
            if (auto next = replacement_for(source->items[i])) {
                if (!copy) {
                    copy = std::make_shared<Array>(*source);
                }
                copy->items[i] = std::move(*next);
            }
        }
        return copy ? Value{copy} : node;
    }

    ResolutionCache*                          cache_;
    Theme const&                              theme_;
    ResolveOptions const&                     options_;
    std::optional<Encoding::Signature>        systemSignature_;
    std::optional<Value>                      themeValue_;
    phmap::flat_hash_map<void const*, Value>  resolved_;
};

auto is_empty_container(Value const& graph) -> bool {
    if (auto const* object = graph.getIf<ObjectRef>()) {
        return !*object || (*object)->empty();
    }
    if (auto const* array = graph.getIf<ArrayRef>()) {
        return !*array || (*array)->size() == 0;
    }
    return true;
}

} // namespace

auto ThemeGraphResolver::containsPlaceholder(std::string_view text) -> bool {
    return text.find(kPlaceholderPrefix) != std::string_view::npos;
}

auto ThemeGraphResolver::resolve(Value const& graph, Theme const& theme, ResolveOptions const& options) -> Value {
    if (themeIsEmpty(theme) || is_empty_container(graph)) {
        return graph;
    }

    // Function leaves encode by identity only, so their results cannot be
    // keyed safely; those resolutions always run.
    bool const  useCache = cache_ != nullptr && cache_->enabled() && !options.process_functions;
    std::string key;
    bool        store = useCache;
    if (useCache) {
        key = ResolutionCache::resolutionKey(graph, theme);
        if (auto hit = cache_->getResolution(key)) {
            nm_log("Resolution cache hit (mode " + theme.mode + ")", "ThemeResolver");
            if (hit->unchanged) {
                return graph;
            }
            if (Value::same(hit->source, graph)) {
                return hit->result;
            }
            // A structurally equal graph owned by another caller: its
            // unchanged subtrees must come back as its own, so resolve it
            // here and leave the stored entry to its source.
            store = false;
        }
    }

    Resolution resolution{cache_, theme, options};
    Value      result = resolution.run(graph);

    if (store) {
        bool const unchanged = Value::same(result, graph);
        cache_->setResolution(key, unchanged ? CachedResolution{Value{}, true, Value{}}
                                             : CachedResolution{result, false, graph});
    }
    return result;
}

auto ThemeGraphResolver::resolveString(std::string_view text, Theme const& theme) -> std::optional<std::string> {
    if (themeIsEmpty(theme) || !containsPlaceholder(text)) {
        return std::nullopt;
    }
    Resolution resolution{cache_, theme, ResolveOptions{}};
    return resolution.substitute(text);
}

} // namespace NM
