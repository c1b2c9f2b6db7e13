#include <doctest/doctest.h>

#include <nodememo/cache/ElementCache.hpp>
#include <nodememo/core/CacheContext.hpp>

#include <chrono>
#include <memory>
#include <vector>

using namespace NM;

namespace {

auto entry_with_boundary(std::shared_ptr<MountTracker> const& tracker, std::string const& key) -> CacheEntry {
    CacheEntry entry;
    entry.signature = "sig-" + key;
    entry.boundary  = std::make_shared<LifecycleBoundary>(tracker, key);
    return entry;
}

} // namespace

TEST_SUITE("cache.elements") {

TEST_CASE("replacing an entry retires the boundary it displaced") {
    auto         tracker = std::make_shared<MountTracker>();
    ElementCache cache;

    auto& first    = cache.insert("k", entry_with_boundary(tracker, "k"));
    auto  original = first.boundary;
    original->mount();

    cache.insert("k", entry_with_boundary(tracker, "k"));
    CHECK(original->isRetired());
    CHECK(cache.size() == 1);
    CHECK(cache.find("k")->boundary != original);

    // The displaced boundary no longer touches the tracker.
    CHECK_FALSE(original->unmount());
    CHECK(tracker->isMounted("k"));
}

TEST_CASE("erase and eraseIf report what they removed") {
    auto         tracker = std::make_shared<MountTracker>();
    ElementCache cache;
    for (auto const* key : {"alpha", "beta", "gamma"}) {
        cache.insert(key, entry_with_boundary(tracker, key));
    }

    CHECK(cache.erase("alpha"));
    CHECK_FALSE(cache.erase("alpha"));

    auto removed = cache.eraseIf([](StableKey const& key, CacheEntry const&) { return key.starts_with("g"); });
    CHECK(removed == std::vector<StableKey>{"gamma"});

    auto keys = cache.keys();
    CHECK(keys == std::vector<StableKey>{"beta"});
    CHECK(cache.contains("beta"));
}

TEST_CASE("clear retires every boundary") {
    auto         tracker = std::make_shared<MountTracker>();
    ElementCache cache;
    auto         boundary = cache.insert("one", entry_with_boundary(tracker, "one")).boundary;

    cache.clear();
    CHECK(cache.empty());
    CHECK(boundary->isRetired());
    CHECK_FALSE(boundary->mount());
}

} // TEST_SUITE

TEST_SUITE("core.cache_context") {

TEST_CASE("reset applies new options to every cache") {
    CacheContext context;
    CHECK(context.resolutionCache().resolutionLimit() == 500);

    CacheOptions options;
    options.resolution_cache_limit    = 10;
    options.resolution_eviction_batch = 2;
    options.resolution_cache_policy   = ResolutionCachePolicy::Disabled;
    options.lifecycle_diagnostics     = false;

    context.propsCache().set("sig", Value{"resolved"});
    context.reset(options);

    CHECK(context.options().resolution_cache_limit == 10);
    CHECK(context.resolutionCache().resolutionLimit() == 10);
    CHECK(context.resolutionCache().evictionBatch() == 2);
    CHECK_FALSE(context.resolutionCache().enabled());
    CHECK(context.propsCache().limit() == 10);
    CHECK(context.propsCache().size() == 0);
}

TEST_CASE("the time source can be replaced and restored") {
    CacheContext context;
    auto const   fixed = CacheTimePoint{};
    context.setTimeSource([fixed] { return fixed; });
    CHECK(context.now() == fixed);

    context.setTimeSource(nullptr);
    CHECK(context.now() > fixed);
}

} // TEST_SUITE
