#pragma once

#include <nodememo/eviction/EnvironmentSignals.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace NM {

/**
 * HistoryApi: a session history with replaceable push/replace entry points
 * and popstate listeners.
 *
 * pushState()/replaceState() always go through the public method slots, so an
 * interceptor can swap a slot for a wrapper and later put the original back.
 * The native implementations stay reachable as static functions.
 */
class HistoryApi {
public:
    using StateMethod      = std::function<void(HistoryApi&, std::string const& url)>;
    using PopStateListener = std::function<void()>;
    using ListenerId       = std::uint64_t;

    explicit HistoryApi(std::string initialUrl = "/");

    HistoryApi(HistoryApi const&)            = delete;
    HistoryApi& operator=(HistoryApi const&) = delete;

    // The process-wide history hosts share.
    static auto global() -> HistoryApi&;

    auto pushState(std::string const& url) -> void;
    auto replaceState(std::string const& url) -> void;

    // Move through the entries; dispatch popstate when the position changed.
    auto back() -> bool;
    auto forward() -> bool;

    [[nodiscard]] auto currentUrl() const -> std::string const& { return entries_[index_]; }
    [[nodiscard]] auto length() const noexcept -> std::size_t { return entries_.size(); }

    auto addPopStateListener(PopStateListener listener) -> ListenerId;
    auto removePopStateListener(ListenerId id) -> bool;
    [[nodiscard]] auto popStateListenerCount() const noexcept -> std::size_t { return popListeners_.size(); }

    static auto nativePushState(HistoryApi& history, std::string const& url) -> void;
    static auto nativeReplaceState(HistoryApi& history, std::string const& url) -> void;

    StateMethod pushStateMethod{&HistoryApi::nativePushState};
    StateMethod replaceStateMethod{&HistoryApi::nativeReplaceState};

private:
    auto dispatch_pop_state() -> void;

    std::vector<std::string>                                 entries_;
    std::size_t                                              index_ = 0;
    std::vector<std::pair<ListenerId, PopStateListener>>     popListeners_;
    ListenerId                                               nextListenerId_ = 1;
};

/**
 * HistoryNavigationAdapter: NavigationSource over a HistoryApi.
 *
 * Passive navigation arrives through a popstate listener. Active navigation
 * is caught by wrapping pushStateMethod/replaceStateMethod. The wrap happens
 * at most once per process (a static patched flag guards it, so repeated
 * subscribe calls or a second adapter never stack wrappers); the adapter that
 * installed it restores the original slots on unsubscribe or destruction.
 */
class HistoryNavigationAdapter final : public NavigationSource {
public:
    explicit HistoryNavigationAdapter(HistoryApi& history = HistoryApi::global());
    ~HistoryNavigationAdapter() override;

    HistoryNavigationAdapter(HistoryNavigationAdapter const&)            = delete;
    HistoryNavigationAdapter& operator=(HistoryNavigationAdapter const&) = delete;

    auto subscribe(Listener listener) -> void override;
    auto unsubscribe() -> void override;

    [[nodiscard]] static auto historyPatched() -> bool;
    [[nodiscard]] auto        ownsPatch() const -> bool;

private:
    auto notify(NavigationKind kind) -> void;
    auto patch() -> void;
    auto unpatch() -> void;

    HistoryApi&                          history_;
    Listener                             listener_;
    std::optional<HistoryApi::ListenerId> popStateListener_;
};

} // namespace NM
