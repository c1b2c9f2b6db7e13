#include <nodememo/lifecycle/LifecycleBoundary.hpp>

#include <nodememo/lifecycle/MountTracker.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace NM {

LifecycleBoundary::LifecycleBoundary(std::weak_ptr<MountTracker> tracker, std::string key)
    : state_(std::make_shared<State>(State{std::move(tracker), std::move(key)})) {
    std::weak_ptr<State> weakState = state_;
    unmountCallback_               = [weakState] {
        if (auto state = weakState.lock()) {
            unmount_state(*state);
        }
    };
}

LifecycleBoundary::~LifecycleBoundary() {
    if (state_->mounted && !state_->retired) {
        nm_log("Boundary for " + state_->key + " destroyed while mounted", "NodeCache");
        unmount_state(*state_);
    }
}

auto LifecycleBoundary::unmount_state(State& state) -> bool {
    if (!state.mounted || state.retired) {
        return false;
    }
    state.mounted = false;
    if (auto tracker = state.tracker.lock()) {
        tracker->untrackMount(state.key);
    }
    return true;
}

auto LifecycleBoundary::mount() -> bool {
    if (state_->mounted || state_->retired) {
        return false;
    }
    state_->mounted = true;
    if (auto tracker = state_->tracker.lock()) {
        tracker->trackMount(state_->key);
    }
    return true;
}

auto LifecycleBoundary::unmount() -> bool {
    return unmount_state(*state_);
}

auto LifecycleBoundary::retarget(std::string key) -> void {
    if (key == state_->key) {
        return;
    }
    auto tracker = state_->tracker.lock();
    if (state_->mounted && !state_->retired && tracker) {
        tracker->untrackMount(state_->key);
        tracker->trackMount(key);
    }
    state_->key = std::move(key);
}

auto LifecycleBoundary::retire() -> void {
    state_->retired = true;
}

auto LifecycleBoundary::key() const -> std::string const& {
    return state_->key;
}

auto LifecycleBoundary::isMounted() const noexcept -> bool {
    return state_->mounted;
}

auto LifecycleBoundary::isRetired() const noexcept -> bool {
    return state_->retired;
}

} // namespace NM
