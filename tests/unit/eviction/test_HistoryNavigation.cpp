#include <doctest/doctest.h>

#include <nodememo/eviction/HistoryNavigation.hpp>

#include <vector>

using namespace NM;

TEST_SUITE("eviction.history") {

TEST_CASE("native history keeps a linear stack of entries") {
    HistoryApi history{"/home"};
    history.pushState("/a");
    history.pushState("/b");
    CHECK(history.length() == 3);
    CHECK(history.currentUrl() == "/b");

    CHECK(history.back());
    CHECK(history.currentUrl() == "/a");
    history.pushState("/c");
    CHECK(history.length() == 3);
    CHECK_FALSE(history.forward());

    history.replaceState("/d");
    CHECK(history.currentUrl() == "/d");
    CHECK(history.length() == 3);
}

TEST_CASE("adapter reports programmatic and back/forward navigation") {
    HistoryApi                  history;
    HistoryNavigationAdapter    adapter{history};
    std::vector<NavigationKind> seen;

    adapter.subscribe([&](NavigationKind kind) { seen.push_back(kind); });
    history.pushState("/next");
    history.replaceState("/next?tab=2");
    history.back();

    CHECK(seen == std::vector<NavigationKind>{NavigationKind::Active, NavigationKind::Active, NavigationKind::Passive});
    CHECK(history.currentUrl() == "/");
    adapter.unsubscribe();
}

TEST_CASE("repeated subscribe patches once and registers one popstate listener") {
    HistoryApi               history;
    HistoryNavigationAdapter adapter{history};
    int                      calls = 0;

    adapter.subscribe([&](NavigationKind) { ++calls; });
    adapter.subscribe([&](NavigationKind) { ++calls; });
    adapter.subscribe([&](NavigationKind) { ++calls; });

    CHECK(HistoryNavigationAdapter::historyPatched());
    CHECK(adapter.ownsPatch());
    CHECK(history.popStateListenerCount() == 1);

    history.pushState("/x");
    CHECK(calls == 1);
    adapter.unsubscribe();
}

TEST_CASE("unsubscribe restores the original entry points") {
    HistoryApi               history;
    HistoryNavigationAdapter adapter{history};
    int                      calls = 0;

    adapter.subscribe([&](NavigationKind) { ++calls; });
    adapter.unsubscribe();

    CHECK_FALSE(HistoryNavigationAdapter::historyPatched());
    CHECK(history.popStateListenerCount() == 0);
    history.pushState("/after");
    history.back();
    CHECK(calls == 0);
    CHECK(history.length() == 2);

    // The native behaviour is intact after the restore.
    history.forward();
    CHECK(history.currentUrl() == "/after");
}

TEST_CASE("a second adapter never stacks a second interception") {
    HistoryApi               history;
    HistoryNavigationAdapter first{history};
    HistoryNavigationAdapter second{history};
    int                      firstCalls  = 0;
    int                      secondCalls = 0;

    first.subscribe([&](NavigationKind) { ++firstCalls; });
    second.subscribe([&](NavigationKind) { ++secondCalls; });
    CHECK(first.ownsPatch());
    CHECK_FALSE(second.ownsPatch());

    history.pushState("/one");
    CHECK(firstCalls == 1);
    CHECK(secondCalls == 0);

    history.back();
    CHECK(firstCalls == 2);
    CHECK(secondCalls == 1);

    second.unsubscribe();
    CHECK(HistoryNavigationAdapter::historyPatched());
    first.unsubscribe();
    CHECK_FALSE(HistoryNavigationAdapter::historyPatched());
}

TEST_CASE("destroying a subscribed adapter releases the history") {
    HistoryApi history;
    {
        HistoryNavigationAdapter adapter{history};
        adapter.subscribe([](NavigationKind) {});
        CHECK(HistoryNavigationAdapter::historyPatched());
    }
    CHECK_FALSE(HistoryNavigationAdapter::historyPatched());
    CHECK(history.popStateListenerCount() == 0);
    history.pushState("/safe");
    CHECK(history.currentUrl() == "/safe");
}

} // TEST_SUITE
