#pragma once

#include <nodememo/core/CacheContext.hpp>
#include <nodememo/eviction/EnvironmentSignals.hpp>
#include <nodememo/eviction/Scheduler.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace NM {

enum class EvictionReason {
    Navigation,
    HiddenPage,
    MemoryPressure,
    Unload,
    Manual,
};

[[nodiscard]] auto evictionReasonToString(EvictionReason reason) -> std::string_view;

struct EvictionReport {
    EvictionReason reason;
    std::size_t    evicted   = 0;
    std::size_t    remaining = 0;
};

struct EvictionSources {
    std::shared_ptr<NavigationSource> navigation;
    std::shared_ptr<VisibilitySource> visibility;
    std::shared_ptr<UnloadSource>     unload;
    std::shared_ptr<MemoryProbe>      memory;
};

/**
 * EvictionController: decides when unmounted ElementCache entries go.
 *
 * Between start() and stop() it listens to the configured sources:
 *  - navigation: bursts are coalesced by the navigation debounce; the sweep
 *    then drops every unmounted or stale entry. Mount state is read when the
 *    sweep runs, so a key remounted during the debounce window survives.
 *    The resolved-props cache is dropped too once it outgrows its threshold.
 *  - memory: sampled every check interval; above the high-water mark an
 *    emergency sweep runs and the ResolutionCache is emptied.
 *  - visibility: a page hidden for the hidden-sweep delay gets a sweep.
 *  - unload: the controller stops and every cache is cleared.
 *
 * start() and stop() are idempotent, and every listener is created once and
 * reused across start/stop cycles. stop() and the destructor cancel every
 * pending timer, including one armed by notifyNavigation() while stopped. A missing source or an unavailable memory
 * reading disables that kind of monitoring and is never an error.
 */
class EvictionController {
public:
    using EvictionHook = std::function<void(EvictionReport const&)>;

    EvictionController(CacheContext& context, Scheduler& scheduler, EvictionSources sources = {});
    ~EvictionController();

    EvictionController(EvictionController const&)            = delete;
    EvictionController& operator=(EvictionController const&) = delete;

    auto start() -> void;
    auto stop() -> void;
    [[nodiscard]] auto isRunning() const noexcept -> bool { return running_; }

    // Same path a navigation signal takes: (re)arms the debounce timer.
    auto notifyNavigation(NavigationKind kind = NavigationKind::Active) -> void;

    // Sweeps immediately with the navigation policies.
    auto sweepNow(EvictionReason reason = EvictionReason::Manual) -> EvictionReport;
    auto emergencySweep() -> EvictionReport;

    // Samples the memory probe once and reacts to it. Returns the usage ratio,
    // or std::nullopt when no reading is available.
    auto checkMemory() -> std::optional<double>;

    // Development diagnostic: called after every sweep.
    auto setEvictionHook(EvictionHook hook) -> void { hook_ = std::move(hook); }

    [[nodiscard]] auto navigationSweepPending() const noexcept -> bool { return navigationTimer_ != 0; }
    [[nodiscard]] auto memoryMonitoringActive() const noexcept -> bool { return memoryTimer_ != 0; }

private:
    auto on_navigation(NavigationKind kind) -> void;
    auto on_visibility(bool hidden) -> void;
    auto on_unload() -> void;

    auto schedule_memory_check() -> void;
    auto cancel_timer(TimerId& id) -> void;
    auto report(EvictionReport const& report) -> EvictionReport;

    CacheContext&   context_;
    Scheduler&      scheduler_;
    EvictionSources sources_;
    EvictionHook    hook_;

    NavigationSource::Listener navigationListener_;
    VisibilitySource::Listener visibilityListener_;
    UnloadSource::Listener     unloadListener_;

    TimerId navigationTimer_ = 0;
    TimerId hiddenTimer_     = 0;
    TimerId memoryTimer_     = 0;
    bool    running_         = false;
};

} // namespace NM
