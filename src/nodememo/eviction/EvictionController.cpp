#include <nodememo/eviction/EvictionController.hpp>

#include <nodememo/eviction/EvictionPolicies.hpp>

#include "log/TaggedLogger.hpp"

#include <array>
#include <cstdio>
#include <string>

namespace NM {

namespace {

[[maybe_unused]] auto format_percent(double ratio) -> std::string {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", ratio * 100.0);
    return buffer;
}

} // namespace

auto evictionReasonToString(EvictionReason reason) -> std::string_view {
    switch (reason) {
    case EvictionReason::Navigation:
        return "navigation";
    case EvictionReason::HiddenPage:
        return "hidden-page";
    case EvictionReason::MemoryPressure:
        return "memory-pressure";
    case EvictionReason::Unload:
        return "unload";
    case EvictionReason::Manual:
        return "manual";
    }
    return "unknown";
}

EvictionController::EvictionController(CacheContext& context, Scheduler& scheduler, EvictionSources sources)
    : context_(context),
      scheduler_(scheduler),
      sources_(std::move(sources)),
      navigationListener_([this](NavigationKind kind) { on_navigation(kind); }),
      visibilityListener_([this](bool hidden) { on_visibility(hidden); }),
      unloadListener_([this] { on_unload(); }) {}

EvictionController::~EvictionController() {
    stop();
}

auto EvictionController::start() -> void {
    if (running_) {
        return;
    }
    running_ = true;

    if (sources_.navigation) {
        sources_.navigation->subscribe(navigationListener_);
    }
    if (sources_.visibility) {
        sources_.visibility->subscribe(visibilityListener_);
    }
    if (sources_.unload) {
        sources_.unload->subscribe(unloadListener_);
    }

    if (context_.options().memory_monitoring && sources_.memory) {
        if (sources_.memory->sample()) {
            schedule_memory_check();
        } else {
            nm_log("Memory usage unavailable, monitoring disabled", "MemoryPressure", "INFO");
        }
    }
    nm_log("EvictionController started", "EvictionController");
}

// Timers are cancelled even when the controller is not running: the public
// entry points can arm them outside start()/stop(), and every callback
// captures `this`.
auto EvictionController::stop() -> void {
    cancel_timer(navigationTimer_);
    cancel_timer(hiddenTimer_);
    cancel_timer(memoryTimer_);
    if (!running_) {
        return;
    }
    running_ = false;

    if (sources_.navigation) {
        sources_.navigation->unsubscribe();
    }
    if (sources_.visibility) {
        sources_.visibility->unsubscribe();
    }
    if (sources_.unload) {
        sources_.unload->unsubscribe();
    }
    nm_log("EvictionController stopped", "EvictionController");
}

auto EvictionController::notifyNavigation(NavigationKind kind) -> void {
    on_navigation(kind);
}

auto EvictionController::on_navigation(NavigationKind kind) -> void {
    nm_log(std::string{"Navigation signal ("} + std::string{navigationKindToString(kind)} + ")", "Navigation");
    cancel_timer(navigationTimer_);
    navigationTimer_ = scheduler_.schedule(context_.options().navigation_debounce, [this] {
        navigationTimer_ = 0;
        auto const propsSize = context_.propsCache().size();
        if (propsSize > context_.options().props_cache_clear_threshold) {
            context_.propsCache().clear();
            nm_log("Dropped " + std::to_string(propsSize) + " resolved props entries", "Navigation");
        }
        sweepNow(EvictionReason::Navigation);
    });
}

auto EvictionController::on_visibility(bool hidden) -> void {
    cancel_timer(hiddenTimer_);
    if (!hidden) {
        return;
    }
    hiddenTimer_ = scheduler_.schedule(context_.options().hidden_sweep_delay, [this] {
        hiddenTimer_ = 0;
        if (sources_.visibility && sources_.visibility->isHidden()) {
            sweepNow(EvictionReason::HiddenPage);
        }
    });
}

auto EvictionController::on_unload() -> void {
    auto const cached = context_.elements().size();
    stop();
    context_.clearCaches();
    report(EvictionReport{EvictionReason::Unload, cached, 0});
}

auto EvictionController::sweepNow(EvictionReason reason) -> EvictionReport {
    static std::array<Eviction::Policy, 2> const policies{&Eviction::evict_unmounted, &Eviction::evict_old_unmounted};

    Eviction::PolicyContext const policyContext{*context_.mountTracker(), context_.now(), context_.options().stale_entry_age};
    auto const evicted = Eviction::sweep(context_.elements(), policies, policyContext);
    return report(EvictionReport{reason, evicted.size(), context_.elements().size()});
}

auto EvictionController::emergencySweep() -> EvictionReport {
    static std::array<Eviction::Policy, 1> const policies{&Eviction::emergency};

    Eviction::PolicyContext const policyContext{*context_.mountTracker(), context_.now(), context_.options().stale_entry_age};
    auto const evicted = Eviction::sweep(context_.elements(), policies, policyContext);
    context_.resolutionCache().clear();
    return report(EvictionReport{EvictionReason::MemoryPressure, evicted.size(), context_.elements().size()});
}

auto EvictionController::checkMemory() -> std::optional<double> {
    if (!sources_.memory) {
        return std::nullopt;
    }
    auto const usage = sources_.memory->sample();
    if (!usage || usage->limit_bytes == 0) {
        return std::nullopt;
    }
    auto const ratio = usage->ratio();
    if (ratio > context_.options().memory_high_water) {
        [[maybe_unused]] auto const result = emergencySweep();
        nm_log("High memory usage (" + format_percent(ratio) + "), emergency sweep evicted "
                   + std::to_string(result.evicted) + " entries",
               "MemoryPressure", "WARN");
    }
    return ratio;
}

auto EvictionController::schedule_memory_check() -> void {
    if (memoryTimer_ != 0) {
        return;
    }
    memoryTimer_ = scheduler_.schedule(context_.options().memory_check_interval, [this] {
        memoryTimer_ = 0;
        checkMemory();
        // The eviction hook may have restarted the controller, which already
        // armed the next check.
        if (running_) {
            schedule_memory_check();
        }
    });
}

auto EvictionController::cancel_timer(TimerId& id) -> void {
    if (id != 0) {
        scheduler_.cancel(id);
        id = 0;
    }
}

auto EvictionController::report(EvictionReport const& result) -> EvictionReport {
    if (result.evicted > 0) {
        nm_log("Evicted " + std::to_string(result.evicted) + " entries (" + std::string{evictionReasonToString(result.reason)}
                   + "), " + std::to_string(result.remaining) + " remain",
               "EvictionController");
    }
    if (hook_) {
        hook_(result);
    }
    return result;
}

} // namespace NM
