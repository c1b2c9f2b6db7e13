#pragma once

#include <functional>
#include <memory>
#include <string>

namespace NM {

class MountTracker;

/**
 * LifecycleBoundary: the one wrapper around a cached artifact that reports
 * its slot to the MountTracker.
 *
 * The host calls mount() when the artifact becomes visible and unmount() when
 * it goes away; each fires once per transition. The unmount callback handed
 * to the host is created once and always acts on the boundary's current key,
 * so a slot whose key was retargeted never untracks a stale key.
 *
 * Once the ElementCache evicts the slot the boundary is retired and ignores
 * further notifications. Destroying a boundary that is still mounted untracks
 * its key; that path only catches hosts that never reported the unmount.
 */
class LifecycleBoundary {
public:
    using Callback = std::function<void()>;

    LifecycleBoundary(std::weak_ptr<MountTracker> tracker, std::string key);
    ~LifecycleBoundary();

    LifecycleBoundary(LifecycleBoundary const&)            = delete;
    LifecycleBoundary& operator=(LifecycleBoundary const&) = delete;

    // Return true when the call changed the mount state.
    auto mount() -> bool;
    auto unmount() -> bool;

    // Points the boundary at another key; a mounted boundary moves its
    // tracker membership along with it.
    auto retarget(std::string key) -> void;

    auto retire() -> void;

    [[nodiscard]] auto key() const -> std::string const&;
    [[nodiscard]] auto isMounted() const noexcept -> bool;
    [[nodiscard]] auto isRetired() const noexcept -> bool;

    // Stable for the lifetime of the boundary; a no-op once it is destroyed.
    [[nodiscard]] auto unmountCallback() const -> Callback const& { return unmountCallback_; }

private:
    struct State {
        std::weak_ptr<MountTracker> tracker;
        std::string                 key;
        bool                        mounted = false;
        bool                        retired = false;
    };

    static auto unmount_state(State& state) -> bool;

    std::shared_ptr<State> state_;
    Callback               unmountCallback_;
};

} // namespace NM
