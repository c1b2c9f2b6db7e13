#include <nodememo/core/CacheContext.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace NM {

CacheContext::CacheContext(CacheOptions options)
    : options_(std::move(options)),
      mountTracker_(std::make_shared<MountTracker>(options_.lifecycle_diagnostics)),
      resolutionCache_(options_),
      resolver_(&resolutionCache_),
      propsCache_(options_.resolution_cache_limit, options_.resolution_eviction_batch),
      timeSource_([] { return CacheClock::now(); }) {}

auto CacheContext::reset(CacheOptions options) -> void {
    clearCaches();
    options_ = std::move(options);
    mountTracker_->setDiagnostics(options_.lifecycle_diagnostics);
    resolutionCache_.configure(options_);
    propsCache_.reconfigure(options_.resolution_cache_limit, options_.resolution_eviction_batch);
}

auto CacheContext::clearCaches() -> void {
    nm_log("Clearing " + std::to_string(elements_.size()) + " elements and "
               + std::to_string(resolutionCache_.resolutionCount()) + " resolutions",
           "NodeCache", "INFO");
    elements_.clear();
    mountTracker_->clear();
    resolutionCache_.clear();
    propsCache_.clear();
}

auto CacheContext::setTimeSource(TimeSource source) -> void {
    if (source) {
        timeSource_ = std::move(source);
    } else {
        timeSource_ = [] { return CacheClock::now(); };
    }
}

} // namespace NM
