#include <nodememo/cache/ResolutionCache.hpp>

#include "log/TaggedLogger.hpp"

namespace NM {

ResolutionCache::ResolutionCache(CacheOptions const& options)
    : resolutions_(options.resolution_cache_limit, options.resolution_eviction_batch),
      pathLookups_(options.path_lookup_cache_limit, options.resolution_eviction_batch),
      enabled_(resolutionCachingAllowed(options)) {}

auto ResolutionCache::configure(CacheOptions const& options) -> void {
    resolutions_.reconfigure(options.resolution_cache_limit, options.resolution_eviction_batch);
    pathLookups_.reconfigure(options.path_lookup_cache_limit, options.resolution_eviction_batch);
    enabled_ = resolutionCachingAllowed(options);
    if (!enabled_) {
        resolutions_.clear();
    }
}

auto ResolutionCache::resolutionKey(Value const& graph, Theme const& theme) -> std::string {
    std::string key = Encoding::encode(graph);
    key.push_back('_');
    key.append(theme.mode);
    key.push_back('_');
    key.append(theme.system ? Encoding::encode(Value{theme.system}) : std::string{"{}"});
    return key;
}

auto ResolutionCache::pathLookupKey(Encoding::Signature const& systemSignature, std::string_view path) -> std::string {
    std::string key;
    key.reserve(systemSignature.size() + 1 + path.size());
    key.append(systemSignature);
    key.push_back('_');
    key.append(path);
    return key;
}

auto ResolutionCache::getResolution(std::string const& key) -> std::optional<CachedResolution> {
    if (!enabled_) {
        return std::nullopt;
    }
    return resolutions_.get(key);
}

auto ResolutionCache::setResolution(std::string const& key, CachedResolution resolution) -> void {
    if (!enabled_) {
        return;
    }
    auto const evictionsBefore = resolutions_.stats().evictions;
    resolutions_.set(key, std::move(resolution));
    if (resolutions_.stats().evictions != evictionsBefore) {
        nm_log("Evicted " + std::to_string(resolutions_.stats().evictions - evictionsBefore)
                   + " resolutions, " + std::to_string(resolutions_.size()) + " remain",
               "ThemeResolver");
    }
}

auto ResolutionCache::getPathLookup(std::string const& key) -> std::optional<PathLookup> {
    return pathLookups_.get(key);
}

auto ResolutionCache::setPathLookup(std::string const& key, PathLookup lookup) -> void {
    pathLookups_.set(key, std::move(lookup));
}

auto ResolutionCache::stats() const -> Stats {
    return Stats{resolutions_.stats(), pathLookups_.stats()};
}

auto ResolutionCache::clear() -> void {
    resolutions_.clear();
    pathLookups_.clear();
}

} // namespace NM
