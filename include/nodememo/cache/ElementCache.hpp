#pragma once

#include <nodememo/encode/CanonicalEncoder.hpp>
#include <nodememo/lifecycle/LifecycleBoundary.hpp>
#include <nodememo/node/Artifact.hpp>
#include <nodememo/node/StableKey.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace NM {

using CacheClock     = std::chrono::steady_clock;
using CacheTimePoint = CacheClock::time_point;

struct CacheEntry {
    Encoding::Signature                signature;
    ArtifactRef                        artifact;
    std::shared_ptr<LifecycleBoundary> boundary;
    // Caller's node object, when it handed one over. An expired owner lets an
    // unmounted entry go regardless of its age or score.
    std::weak_ptr<void const> owner;
    bool                      has_owner = false;
    CacheTimePoint            created_at{};
    CacheTimePoint            last_access{};
    std::uint64_t             access_count   = 0;
    std::size_t               estimated_size = 1;

    [[nodiscard]] auto ownerExpired() const -> bool { return has_owner && owner.expired(); }
};

/**
 * ElementCache: StableKey -> last signature and artifact of that slot.
 *
 * Every entry owns the slot's single LifecycleBoundary. Removing an entry
 * (erase, eraseIf, clear) retires its boundary so late host notifications
 * for the evicted slot are ignored.
 */
class ElementCache {
public:
    using Map = phmap::node_hash_map<StableKey, CacheEntry>;

    [[nodiscard]] auto find(StableKey const& key) -> CacheEntry*;
    [[nodiscard]] auto find(StableKey const& key) const -> CacheEntry const*;
    [[nodiscard]] auto contains(StableKey const& key) const -> bool { return entries_.contains(key); }

    auto insert(StableKey const& key, CacheEntry entry) -> CacheEntry&;
    auto erase(StableKey const& key) -> bool;

    // Removes every entry the predicate selects; returns the removed keys.
    auto eraseIf(std::function<bool(StableKey const&, CacheEntry const&)> const& predicate) -> std::vector<StableKey>;

    [[nodiscard]] auto keys() const -> std::vector<StableKey>;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    auto clear() -> void;

private:
    Map entries_;
};

} // namespace NM
