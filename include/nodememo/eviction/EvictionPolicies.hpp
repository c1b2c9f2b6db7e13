#pragma once

#include <nodememo/cache/ElementCache.hpp>
#include <nodememo/lifecycle/MountTracker.hpp>

#include <chrono>
#include <functional>
#include <span>
#include <vector>

namespace NM::Eviction {

struct PolicyContext {
    MountTracker const&       tracker;
    CacheTimePoint            now;
    std::chrono::milliseconds stale_age{std::chrono::minutes{10}};
};

using Policy = std::function<bool(StableKey const&, CacheEntry const&, PolicyContext const&)>;

// Size x usage score above which the emergency policy evicts.
inline constexpr double kEmergencyScoreThreshold = 1000.0;

/*
 * All policies keep mounted keys. An expired owner only lets an unmounted
 * entry skip the age and score thresholds.
 */

// Every key absent from the mount set.
[[nodiscard]] auto evict_unmounted(StableKey const& key, CacheEntry const& entry, PolicyContext const& context) -> bool;

// Unmounted keys older than the stale age (measured from the last rebuild).
[[nodiscard]] auto evict_old_unmounted(StableKey const& key, CacheEntry const& entry, PolicyContext const& context) -> bool;

// Unmounted keys that are large and rarely used:
// estimated_size * 1000 / (access_count + 1) > 1000.
[[nodiscard]] auto emergency(StableKey const& key, CacheEntry const& entry, PolicyContext const& context) -> bool;

[[nodiscard]] auto emergency_score(CacheEntry const& entry) -> double;

// Erases every entry any of the policies selects; returns the erased keys.
auto sweep(ElementCache& cache, std::span<Policy const> policies, PolicyContext const& context) -> std::vector<StableKey>;

} // namespace NM::Eviction
