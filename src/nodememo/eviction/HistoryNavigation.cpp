#include <nodememo/eviction/HistoryNavigation.hpp>

#include <nodememo/core/Error.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace NM {

namespace {

// Process-wide interception state; one wrap of pushState/replaceState at a time.
struct HistoryPatch {
    bool                            patched = false;
    HistoryApi*                     history = nullptr;
    HistoryNavigationAdapter const* owner   = nullptr;
    HistoryApi::StateMethod         originalPush;
    HistoryApi::StateMethod         originalReplace;
};

auto history_patch() -> HistoryPatch& {
    static HistoryPatch patch;
    return patch;
}

} // namespace

auto navigationKindToString(NavigationKind kind) -> std::string_view {
    switch (kind) {
    case NavigationKind::Passive:
        return "passive";
    case NavigationKind::Active:
        return "active";
    }
    return "unknown";
}

HistoryApi::HistoryApi(std::string initialUrl) {
    entries_.push_back(std::move(initialUrl));
}

auto HistoryApi::global() -> HistoryApi& {
    static HistoryApi history;
    return history;
}

// The slot is copied first: a wrapper may restore the original mid-call.
auto HistoryApi::pushState(std::string const& url) -> void {
    auto method = pushStateMethod;
    method(*this, url);
}

auto HistoryApi::replaceState(std::string const& url) -> void {
    auto method = replaceStateMethod;
    method(*this, url);
}

auto HistoryApi::nativePushState(HistoryApi& history, std::string const& url) -> void {
    history.entries_.resize(history.index_ + 1);
    history.entries_.push_back(url);
    history.index_ = history.entries_.size() - 1;
}

auto HistoryApi::nativeReplaceState(HistoryApi& history, std::string const& url) -> void {
    history.entries_[history.index_] = url;
}

auto HistoryApi::back() -> bool {
    if (index_ == 0) {
        return false;
    }
    --index_;
    dispatch_pop_state();
    return true;
}

auto HistoryApi::forward() -> bool {
    if (index_ + 1 >= entries_.size()) {
        return false;
    }
    ++index_;
    dispatch_pop_state();
    return true;
}

auto HistoryApi::addPopStateListener(PopStateListener listener) -> ListenerId {
    auto const id = nextListenerId_++;
    popListeners_.emplace_back(id, std::move(listener));
    return id;
}

auto HistoryApi::removePopStateListener(ListenerId id) -> bool {
    auto it = std::find_if(popListeners_.begin(), popListeners_.end(), [id](auto const& entry) {
        return entry.first == id;
    });
    if (it == popListeners_.end()) {
        return false;
    }
    popListeners_.erase(it);
    return true;
}

auto HistoryApi::dispatch_pop_state() -> void {
    // Listeners may remove themselves while being notified.
    auto const listeners = popListeners_;
    for (auto const& [id, listener] : listeners) {
        if (listener) {
            listener();
        }
    }
}

HistoryNavigationAdapter::HistoryNavigationAdapter(HistoryApi& history)
    : history_(history) {}

HistoryNavigationAdapter::~HistoryNavigationAdapter() {
    unsubscribe();
}

auto HistoryNavigationAdapter::historyPatched() -> bool {
    return history_patch().patched;
}

auto HistoryNavigationAdapter::ownsPatch() const -> bool {
    auto const& state = history_patch();
    return state.patched && state.owner == this;
}

auto HistoryNavigationAdapter::subscribe(Listener listener) -> void {
    listener_ = std::move(listener);
    if (!popStateListener_) {
        popStateListener_ = history_.addPopStateListener([this] { notify(NavigationKind::Passive); });
    }
    patch();
}

auto HistoryNavigationAdapter::unsubscribe() -> void {
    if (popStateListener_) {
        history_.removePopStateListener(*popStateListener_);
        popStateListener_.reset();
    }
    unpatch();
    listener_ = nullptr;
}

auto HistoryNavigationAdapter::notify(NavigationKind kind) -> void {
    auto listener = listener_;
    if (listener) {
        nm_log(std::string{"History navigation ("} + std::string{navigationKindToString(kind)} + ")", "Navigation");
        listener(kind);
    }
}

auto HistoryNavigationAdapter::patch() -> void {
    auto& state = history_patch();
    if (state.patched) {
        if (state.owner != this) {
            nm_log(describeError(make_error("pushState/replaceState already intercepted by another adapter",
                                            Error::Code::PatchConflict)),
                   "Navigation", "WARN");
        }
        return;
    }

    state.originalPush    = history_.pushStateMethod;
    state.originalReplace = history_.replaceStateMethod;
    state.history         = &history_;
    state.owner           = this;
    state.patched         = true;

    history_.pushStateMethod = [this, original = state.originalPush](HistoryApi& history, std::string const& url) {
        original(history, url);
        notify(NavigationKind::Active);
    };
    history_.replaceStateMethod = [this, original = state.originalReplace](HistoryApi& history, std::string const& url) {
        original(history, url);
        notify(NavigationKind::Active);
    };
    nm_log("History methods intercepted", "Navigation");
}

auto HistoryNavigationAdapter::unpatch() -> void {
    auto& state = history_patch();
    if (!state.patched || state.owner != this) {
        return;
    }
    state.history->pushStateMethod    = std::move(state.originalPush);
    state.history->replaceStateMethod = std::move(state.originalReplace);
    state                             = HistoryPatch{};
    nm_log("History methods restored", "Navigation");
}

} // namespace NM
