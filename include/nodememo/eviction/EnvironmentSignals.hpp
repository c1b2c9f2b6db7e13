#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace NM {

enum class NavigationKind {
    Passive, // back/forward
    Active,  // programmatic push/replace
};

[[nodiscard]] auto navigationKindToString(NavigationKind kind) -> std::string_view;

/**
 * Read-only environment signals the EvictionController listens to. Every one
 * is optional: a controller without a source simply skips that kind of
 * monitoring.
 *
 * Sources hold a single listener. subscribe() replaces any previous one and
 * unsubscribe() drops it; both are safe to call from inside a dispatch.
 */
struct NavigationSource {
    using Listener = std::function<void(NavigationKind)>;

    virtual ~NavigationSource() = default;

    virtual auto subscribe(Listener listener) -> void = 0;
    virtual auto unsubscribe() -> void                = 0;
};

struct VisibilitySource {
    using Listener = std::function<void(bool hidden)>;

    virtual ~VisibilitySource() = default;

    virtual auto subscribe(Listener listener) -> void = 0;
    virtual auto unsubscribe() -> void                = 0;
    [[nodiscard]] virtual auto isHidden() const -> bool = 0;
};

struct UnloadSource {
    using Listener = std::function<void()>;

    virtual ~UnloadSource() = default;

    virtual auto subscribe(Listener listener) -> void = 0;
    virtual auto unsubscribe() -> void                = 0;
};

struct MemoryUsage {
    std::uint64_t used_bytes  = 0;
    std::uint64_t limit_bytes = 0;

    // used / limit, or 0 when the limit is unknown.
    [[nodiscard]] auto ratio() const -> double {
        return limit_bytes == 0 ? 0.0 : static_cast<double>(used_bytes) / static_cast<double>(limit_bytes);
    }
};

struct MemoryProbe {
    virtual ~MemoryProbe() = default;

    // std::nullopt when the platform cannot report usage right now.
    virtual auto sample() -> std::optional<MemoryUsage> = 0;
};

} // namespace NM
