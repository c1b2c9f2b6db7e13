#pragma once

#include <nodememo/cache/ElementCache.hpp>
#include <nodememo/cache/LruCache.hpp>
#include <nodememo/cache/ResolutionCache.hpp>
#include <nodememo/config/CacheOptions.hpp>
#include <nodememo/encode/CanonicalEncoder.hpp>
#include <nodememo/lifecycle/MountTracker.hpp>
#include <nodememo/theme/ThemeGraphResolver.hpp>

#include <functional>
#include <memory>

namespace NM {

/**
 * CacheContext owns everything that would otherwise be a process-wide global:
 * the element cache, the mount set, the resolver with its resolution cache
 * and the resolved-props cache.
 *
 * Hosts create one per process (or per test) and pass it to construct_node
 * and the EvictionController. Not copyable; the mount tracker is shared with
 * the lifecycle boundaries it hands out.
 */
class CacheContext {
public:
    using TimeSource = std::function<CacheTimePoint()>;

    explicit CacheContext(CacheOptions options = {});

    CacheContext(CacheContext const&)            = delete;
    CacheContext& operator=(CacheContext const&) = delete;

    // Clears every cache and re-applies `options`.
    auto reset(CacheOptions options) -> void;

    // Empties every cache and the mount set; retires all boundaries.
    auto clearCaches() -> void;

    [[nodiscard]] auto options() const noexcept -> CacheOptions const& { return options_; }

    [[nodiscard]] auto elements() noexcept -> ElementCache& { return elements_; }
    [[nodiscard]] auto elements() const noexcept -> ElementCache const& { return elements_; }
    [[nodiscard]] auto mountTracker() const noexcept -> std::shared_ptr<MountTracker> const& { return mountTracker_; }
    [[nodiscard]] auto resolutionCache() noexcept -> ResolutionCache& { return resolutionCache_; }
    [[nodiscard]] auto resolver() noexcept -> ThemeGraphResolver& { return resolver_; }

    // Resolved props by node signature, shared between slots rendering the
    // same content.
    [[nodiscard]] auto propsCache() noexcept -> LruCache<Encoding::Signature, Value>& { return propsCache_; }

    [[nodiscard]] auto now() const -> CacheTimePoint { return timeSource_(); }
    auto               setTimeSource(TimeSource source) -> void;

private:
    CacheOptions                          options_;
    ElementCache                          elements_;
    std::shared_ptr<MountTracker>         mountTracker_;
    ResolutionCache                       resolutionCache_;
    ThemeGraphResolver                    resolver_;
    LruCache<Encoding::Signature, Value>  propsCache_;
    TimeSource                            timeSource_;
};

} // namespace NM
