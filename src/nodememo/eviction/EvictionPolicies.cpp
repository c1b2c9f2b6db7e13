#include <nodememo/eviction/EvictionPolicies.hpp>

#include <algorithm>

namespace NM::Eviction {

auto evict_unmounted(StableKey const& key, CacheEntry const&, PolicyContext const& context) -> bool {
    return !context.tracker.isMounted(key);
}

auto evict_old_unmounted(StableKey const& key, CacheEntry const& entry, PolicyContext const& context) -> bool {
    if (context.tracker.isMounted(key)) {
        return false;
    }
    if (entry.ownerExpired()) {
        return true;
    }
    return context.now - entry.created_at > context.stale_age;
}

auto emergency_score(CacheEntry const& entry) -> double {
    auto const sizeScore  = static_cast<double>(entry.estimated_size);
    auto const usageScore = 1000.0 / (static_cast<double>(entry.access_count) + 1.0);
    return sizeScore * usageScore;
}

auto emergency(StableKey const& key, CacheEntry const& entry, PolicyContext const& context) -> bool {
    if (context.tracker.isMounted(key)) {
        return false;
    }
    if (entry.ownerExpired()) {
        return true;
    }
    return emergency_score(entry) > kEmergencyScoreThreshold;
}

auto sweep(ElementCache& cache, std::span<Policy const> policies, PolicyContext const& context) -> std::vector<StableKey> {
    return cache.eraseIf([&](StableKey const& key, CacheEntry const& entry) {
        return std::any_of(policies.begin(), policies.end(), [&](Policy const& policy) {
            return policy && policy(key, entry, context);
        });
    });
}

} // namespace NM::Eviction
