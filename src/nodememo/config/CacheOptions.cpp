#include <nodememo/config/CacheOptions.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

namespace NM {

namespace {

using Json = nlohmann::json;

auto lowercase(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return normalized;
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_double(std::string_view text, double& out) {
    double value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    auto normalized = lowercase(text);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto size_setter(char const* key, std::size_t& field) {
    return [key, &field](std::string_view value) {
        std::size_t parsed{};
        if (!parse_integer(value, parsed)) {
            std::cerr << key << " must be a non-negative integer\n";
            return false;
        }
        field = parsed;
        return true;
    };
}

auto millis_setter(char const* key, std::chrono::milliseconds& field) {
    return [key, &field](std::string_view value) {
        std::int64_t parsed{};
        if (!parse_integer(value, parsed) || parsed < 0) {
            std::cerr << key << " must be a non-negative number of milliseconds\n";
            return false;
        }
        field = std::chrono::milliseconds{parsed};
        return true;
    };
}

auto bool_setter(char const* key, bool& field) {
    return [key, &field](std::string_view value) {
        auto parsed = parse_bool(value);
        if (!parsed) {
            std::cerr << key << " must be a boolean (1/0, true/false, yes/no, on/off)\n";
            return false;
        }
        field = *parsed;
        return true;
    };
}

auto invalid(std::string message) -> Error {
    return make_error(std::move(message), Error::Code::InvalidOptions);
}

auto read_size(Json const& json, char const* key, std::size_t& field) -> Expected<void> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            field = it->get<std::size_t>();
            return {};
        }
        return std::unexpected(invalid(std::string{key} + " must be a non-negative integer"));
    }
    return {};
}

auto read_millis(Json const& json, char const* key, std::chrono::milliseconds& field) -> Expected<void> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            using Rep         = std::chrono::milliseconds::rep;
            auto const millis = it->get<std::uint64_t>();
            if (millis > static_cast<std::uint64_t>(std::numeric_limits<Rep>::max())) {
                return std::unexpected(invalid(std::string{key} + " is out of range"));
            }
            field = std::chrono::milliseconds{static_cast<Rep>(millis)};
            return {};
        }
        return std::unexpected(invalid(std::string{key} + " must be a non-negative integer"));
    }
    return {};
}

auto read_bool(Json const& json, char const* key, bool& field) -> Expected<void> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(invalid(std::string{key} + " must be a bool"));
        }
        field = it->get<bool>();
    }
    return {};
}

} // namespace

auto resolutionCachingAllowed(CacheOptions const& options) -> bool {
    switch (options.resolution_cache_policy) {
    case ResolutionCachePolicy::Always:
        return true;
    case ResolutionCachePolicy::NonInteractiveOnly:
        return options.execution_mode == ExecutionMode::NonInteractive;
    case ResolutionCachePolicy::Disabled:
        return false;
    }
    return false;
}

auto policyToString(ResolutionCachePolicy policy) -> std::string_view {
    switch (policy) {
    case ResolutionCachePolicy::Always:
        return "always";
    case ResolutionCachePolicy::NonInteractiveOnly:
        return "non_interactive_only";
    case ResolutionCachePolicy::Disabled:
        return "disabled";
    }
    return "always";
}

auto parsePolicy(std::string_view text) -> std::optional<ResolutionCachePolicy> {
    auto normalized = lowercase(text);
    if (normalized == "always") {
        return ResolutionCachePolicy::Always;
    }
    if (normalized == "non_interactive_only" || normalized == "server") {
        return ResolutionCachePolicy::NonInteractiveOnly;
    }
    if (normalized == "disabled" || normalized == "off") {
        return ResolutionCachePolicy::Disabled;
    }
    return std::nullopt;
}

auto executionModeToString(ExecutionMode mode) -> std::string_view {
    return mode == ExecutionMode::Interactive ? "interactive" : "non_interactive";
}

auto parseExecutionMode(std::string_view text) -> std::optional<ExecutionMode> {
    auto normalized = lowercase(text);
    if (normalized == "interactive" || normalized == "client") {
        return ExecutionMode::Interactive;
    }
    if (normalized == "non_interactive" || normalized == "server") {
        return ExecutionMode::NonInteractive;
    }
    return std::nullopt;
}

auto ValidateCacheOptions(CacheOptions const& options) -> std::optional<std::string> {
    if (options.resolution_cache_limit == 0) {
        return std::string{"resolution_cache_limit must be > 0"};
    }
    if (options.resolution_eviction_batch == 0) {
        return std::string{"resolution_eviction_batch must be > 0"};
    }
    if (options.path_lookup_cache_limit == 0) {
        return std::string{"path_lookup_cache_limit must be > 0"};
    }
    if (options.navigation_debounce.count() < 0) {
        return std::string{"navigation_debounce must be >= 0"};
    }
    if (options.memory_check_interval.count() <= 0) {
        return std::string{"memory_check_interval must be > 0"};
    }
    if (!(options.memory_high_water > 0.0 && options.memory_high_water <= 1.0)) {
        return std::string{"memory_high_water must be within (0, 1]"};
    }
    if (options.hidden_sweep_delay.count() < 0) {
        return std::string{"hidden_sweep_delay must be >= 0"};
    }
    if (options.stale_entry_age.count() < 0) {
        return std::string{"stale_entry_age must be >= 0"};
    }
    return std::nullopt;
}

bool ApplyCacheEnvOverrides(CacheOptions& options) {
    if (!apply_env("NODEMEMO_RESOLUTION_CACHE_LIMIT",
                   size_setter("NODEMEMO_RESOLUTION_CACHE_LIMIT", options.resolution_cache_limit))) {
        return false;
    }
    if (!apply_env("NODEMEMO_RESOLUTION_EVICTION_BATCH",
                   size_setter("NODEMEMO_RESOLUTION_EVICTION_BATCH", options.resolution_eviction_batch))) {
        return false;
    }
    if (!apply_env("NODEMEMO_PATH_LOOKUP_CACHE_LIMIT",
                   size_setter("NODEMEMO_PATH_LOOKUP_CACHE_LIMIT", options.path_lookup_cache_limit))) {
        return false;
    }

    if (!apply_env("NODEMEMO_RESOLUTION_CACHE_POLICY", [&](std::string_view value) {
            auto parsed = parsePolicy(value);
            if (!parsed) {
                std::cerr << "NODEMEMO_RESOLUTION_CACHE_POLICY must be always, non_interactive_only or disabled\n";
                return false;
            }
            options.resolution_cache_policy = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("NODEMEMO_EXECUTION_MODE", [&](std::string_view value) {
            auto parsed = parseExecutionMode(value);
            if (!parsed) {
                std::cerr << "NODEMEMO_EXECUTION_MODE must be interactive or non_interactive\n";
                return false;
            }
            options.execution_mode = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("NODEMEMO_NAVIGATION_DEBOUNCE_MS",
                   millis_setter("NODEMEMO_NAVIGATION_DEBOUNCE_MS", options.navigation_debounce))) {
        return false;
    }
    if (!apply_env("NODEMEMO_MEMORY_CHECK_INTERVAL_MS",
                   millis_setter("NODEMEMO_MEMORY_CHECK_INTERVAL_MS", options.memory_check_interval))) {
        return false;
    }

    if (!apply_env("NODEMEMO_MEMORY_HIGH_WATER", [&](std::string_view value) {
            double parsed{};
            if (!parse_double(value, parsed)) {
                std::cerr << "NODEMEMO_MEMORY_HIGH_WATER must be a number\n";
                return false;
            }
            options.memory_high_water = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("NODEMEMO_MEMORY_MONITORING",
                   bool_setter("NODEMEMO_MEMORY_MONITORING", options.memory_monitoring))) {
        return false;
    }
    if (!apply_env("NODEMEMO_HIDDEN_SWEEP_DELAY_MS",
                   millis_setter("NODEMEMO_HIDDEN_SWEEP_DELAY_MS", options.hidden_sweep_delay))) {
        return false;
    }
    if (!apply_env("NODEMEMO_STALE_ENTRY_AGE_MS",
                   millis_setter("NODEMEMO_STALE_ENTRY_AGE_MS", options.stale_entry_age))) {
        return false;
    }
    if (!apply_env("NODEMEMO_PROPS_CACHE_CLEAR_THRESHOLD",
                   size_setter("NODEMEMO_PROPS_CACHE_CLEAR_THRESHOLD", options.props_cache_clear_threshold))) {
        return false;
    }
    if (!apply_env("NODEMEMO_LIFECYCLE_DIAGNOSTICS",
                   bool_setter("NODEMEMO_LIFECYCLE_DIAGNOSTICS", options.lifecycle_diagnostics))) {
        return false;
    }
    return true;
}

auto LoadCacheOptionsJson(std::string_view text) -> Expected<CacheOptions> {
    auto json = Json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(make_error("cache options are not valid JSON", Error::Code::MalformedInput));
    }
    if (!json.is_object()) {
        return std::unexpected(make_error("cache options must be a JSON object", Error::Code::MalformedInput));
    }

    CacheOptions options;
    for (auto const& step : {
             read_size(json, "resolution_cache_limit", options.resolution_cache_limit),
             read_size(json, "resolution_eviction_batch", options.resolution_eviction_batch),
             read_size(json, "path_lookup_cache_limit", options.path_lookup_cache_limit),
             read_millis(json, "navigation_debounce_ms", options.navigation_debounce),
             read_millis(json, "memory_check_interval_ms", options.memory_check_interval),
             read_bool(json, "memory_monitoring", options.memory_monitoring),
             read_millis(json, "hidden_sweep_delay_ms", options.hidden_sweep_delay),
             read_millis(json, "stale_entry_age_ms", options.stale_entry_age),
             read_size(json, "props_cache_clear_threshold", options.props_cache_clear_threshold),
             read_bool(json, "lifecycle_diagnostics", options.lifecycle_diagnostics),
         }) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }

    if (auto it = json.find("memory_high_water"); it != json.end()) {
        if (!it->is_number()) {
            return std::unexpected(invalid("memory_high_water must be a number"));
        }
        options.memory_high_water = it->get<double>();
    }
    if (auto it = json.find("resolution_cache_policy"); it != json.end()) {
        auto parsed = it->is_string() ? parsePolicy(it->get<std::string>()) : std::nullopt;
        if (!parsed) {
            return std::unexpected(invalid("resolution_cache_policy must be always, non_interactive_only or disabled"));
        }
        options.resolution_cache_policy = *parsed;
    }
    if (auto it = json.find("execution_mode"); it != json.end()) {
        auto parsed = it->is_string() ? parseExecutionMode(it->get<std::string>()) : std::nullopt;
        if (!parsed) {
            return std::unexpected(invalid("execution_mode must be interactive or non_interactive"));
        }
        options.execution_mode = *parsed;
    }

    if (auto problem = ValidateCacheOptions(options)) {
        return std::unexpected(invalid(*problem));
    }
    return options;
}

} // namespace NM
