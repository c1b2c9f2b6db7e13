#pragma once

#include <nodememo/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace NM {

// Which execution contexts may store resolver results.
enum class ResolutionCachePolicy {
    Always,
    NonInteractiveOnly,
    Disabled
};

// Interactive hosts (a client rendering into a live document) care more about
// per-render identity than reuse; NonInteractive hosts render once per request.
enum class ExecutionMode {
    Interactive,
    NonInteractive
};

struct CacheOptions {
    std::size_t resolution_cache_limit{500};
    std::size_t resolution_eviction_batch{50};
    std::size_t path_lookup_cache_limit{500};
    ResolutionCachePolicy resolution_cache_policy{ResolutionCachePolicy::Always};
    ExecutionMode         execution_mode{ExecutionMode::NonInteractive};

    std::chrono::milliseconds navigation_debounce{100};
    std::chrono::milliseconds memory_check_interval{30'000};
    double                    memory_high_water{0.85};
    bool                      memory_monitoring{true};
    std::chrono::milliseconds hidden_sweep_delay{5'000};
    std::chrono::milliseconds stale_entry_age{10 * 60 * 1000};
    std::size_t               props_cache_clear_threshold{200};

    bool lifecycle_diagnostics{true};
};

[[nodiscard]] auto resolutionCachingAllowed(CacheOptions const& options) -> bool;

[[nodiscard]] auto policyToString(ResolutionCachePolicy policy) -> std::string_view;
[[nodiscard]] auto parsePolicy(std::string_view text) -> std::optional<ResolutionCachePolicy>;
[[nodiscard]] auto executionModeToString(ExecutionMode mode) -> std::string_view;
[[nodiscard]] auto parseExecutionMode(std::string_view text) -> std::optional<ExecutionMode>;

/**
 * Reads NODEMEMO_* variables:
 *   NODEMEMO_RESOLUTION_CACHE_LIMIT, NODEMEMO_RESOLUTION_EVICTION_BATCH,
 *   NODEMEMO_PATH_LOOKUP_CACHE_LIMIT, NODEMEMO_RESOLUTION_CACHE_POLICY,
 *   NODEMEMO_EXECUTION_MODE, NODEMEMO_NAVIGATION_DEBOUNCE_MS,
 *   NODEMEMO_MEMORY_CHECK_INTERVAL_MS, NODEMEMO_MEMORY_HIGH_WATER,
 *   NODEMEMO_MEMORY_MONITORING, NODEMEMO_HIDDEN_SWEEP_DELAY_MS,
 *   NODEMEMO_STALE_ENTRY_AGE_MS, NODEMEMO_PROPS_CACHE_CLEAR_THRESHOLD,
 *   NODEMEMO_LIFECYCLE_DIAGNOSTICS.
 * Returns false (after reporting on stderr) at the first value that does not
 * parse; fields applied before it keep their new values.
 */
bool ApplyCacheEnvOverrides(CacheOptions& options);

auto ValidateCacheOptions(CacheOptions const& options) -> std::optional<std::string>;

// Missing keys keep their defaults; durations are given in milliseconds
// ("navigation_debounce_ms" and friends). The result is validated.
auto LoadCacheOptionsJson(std::string_view text) -> Expected<CacheOptions>;

} // namespace NM
