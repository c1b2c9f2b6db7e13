#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <string>

namespace NM {

/**
 * MountTracker: live set of StableKeys whose artifact is currently mounted.
 *
 * Presence means "never evict"; absence makes the ElementCache entry for that
 * key eligible for the next sweep. Tracking is idempotent in both directions.
 *
 * With diagnostics on, repeated untrackMount() of a key that is not mounted is
 * counted and reported from the second call on; the counter resets when the
 * key is tracked again.
 */
class MountTracker {
public:
    explicit MountTracker(bool diagnostics = true) : diagnostics_(diagnostics) {}

    auto trackMount(std::string const& key) -> void;

    // Returns false when the key was not mounted.
    auto untrackMount(std::string const& key) -> bool;

    [[nodiscard]] auto isMounted(std::string const& key) const -> bool;
    [[nodiscard]] auto mountedCount() const noexcept -> std::size_t { return mounted_.size(); }

    // Consecutive untrackMount() calls for `key` while it was not mounted.
    [[nodiscard]] auto strayUnmountCount(std::string const& key) const -> std::size_t;

    auto setDiagnostics(bool enabled) -> void;
    auto clear() -> void;

private:
    phmap::flat_hash_set<std::string>              mounted_;
    phmap::flat_hash_map<std::string, std::size_t> strayUnmounts_;
    bool                                           diagnostics_;
};

} // namespace NM
