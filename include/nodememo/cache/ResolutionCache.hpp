#pragma once

#include <nodememo/cache/LruCache.hpp>
#include <nodememo/config/CacheOptions.hpp>
#include <nodememo/encode/CanonicalEncoder.hpp>
#include <nodememo/theme/Theme.hpp>
#include <nodememo/value/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NM {

struct CachedResolution {
    Value result;
    // The resolution left the graph untouched; a hit hands back the caller's
    // own graph instead of `result`.
    bool unchanged = false;
    // The graph `result` was built from. `result` shares its unchanged
    // subtrees, so only a request for this same graph may receive it.
    Value source;
};

// A memoized theme-path lookup; `value` is empty when the path did not resolve.
struct PathLookup {
    std::optional<Value> value;
};

/**
 * Process-wide memo for ThemeGraphResolver.
 *
 * Resolutions are keyed by the signature of the input graph together with the
 * theme mode and the signature of the theme system, so two themes never share
 * an entry. Path lookups are keyed by theme-system signature and dotted path.
 * Both maps are LruCache instances sized from CacheOptions.
 */
class ResolutionCache {
public:
    struct Stats {
        LruCache<std::string, CachedResolution>::Stats resolutions;
        LruCache<std::string, PathLookup>::Stats       path_lookups;
    };

    explicit ResolutionCache(CacheOptions const& options = {});

    auto configure(CacheOptions const& options) -> void;

    // Whether resolutions may be stored under the configured policy.
    [[nodiscard]] auto enabled() const noexcept -> bool { return enabled_; }

    [[nodiscard]] static auto resolutionKey(Value const& graph, Theme const& theme) -> std::string;
    [[nodiscard]] static auto pathLookupKey(Encoding::Signature const& systemSignature, std::string_view path)
        -> std::string;

    [[nodiscard]] auto getResolution(std::string const& key) -> std::optional<CachedResolution>;
    auto               setResolution(std::string const& key, CachedResolution resolution) -> void;

    [[nodiscard]] auto getPathLookup(std::string const& key) -> std::optional<PathLookup>;
    auto               setPathLookup(std::string const& key, PathLookup lookup) -> void;

    [[nodiscard]] auto resolutionCount() const noexcept -> std::size_t { return resolutions_.size(); }
    [[nodiscard]] auto pathLookupCount() const noexcept -> std::size_t { return pathLookups_.size(); }
    [[nodiscard]] auto resolutionLimit() const noexcept -> std::size_t { return resolutions_.limit(); }
    [[nodiscard]] auto evictionBatch() const noexcept -> std::size_t { return resolutions_.batch(); }
    [[nodiscard]] auto stats() const -> Stats;

    auto clear() -> void;

private:
    LruCache<std::string, CachedResolution> resolutions_;
    LruCache<std::string, PathLookup>       pathLookups_;
    bool                                    enabled_ = true;
};

} // namespace NM
