#include <nodememo/lifecycle/MountTracker.hpp>

#include <nodememo/core/Error.hpp>

#include "log/TaggedLogger.hpp"

namespace NM {

auto MountTracker::trackMount(std::string const& key) -> void {
    mounted_.insert(key);
    if (diagnostics_) {
        strayUnmounts_.erase(key);
    }
}

auto MountTracker::untrackMount(std::string const& key) -> bool {
    bool const wasMounted = mounted_.erase(key) > 0;
    if (!wasMounted && diagnostics_) {
        auto const count = ++strayUnmounts_[key];
        if (count > 1) {
            nm_log(describeError(make_error("untrackMount called " + std::to_string(count)
                                                + " times for already unmounted key " + key,
                                            Error::Code::LifecycleInconsistency)),
                   "MountTracker", "WARN");
        }
    }
    return wasMounted;
}

auto MountTracker::isMounted(std::string const& key) const -> bool {
    return mounted_.contains(key);
}

auto MountTracker::strayUnmountCount(std::string const& key) const -> std::size_t {
    if (auto it = strayUnmounts_.find(key); it != strayUnmounts_.end()) {
        return it->second;
    }
    return 0;
}

auto MountTracker::setDiagnostics(bool enabled) -> void {
    diagnostics_ = enabled;
    if (!enabled) {
        strayUnmounts_.clear();
    }
}

auto MountTracker::clear() -> void {
    mounted_.clear();
    strayUnmounts_.clear();
}

} // namespace NM
