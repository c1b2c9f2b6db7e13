#include <doctest/doctest.h>

#include <nodememo/cache/LruCache.hpp>

#include <string>

using namespace NM;

TEST_SUITE("cache.lru") {

TEST_CASE("size stays within limit plus batch while inserting") {
    LruCache<int, int> cache{10, 3};
    for (int i = 0; i < 1000; ++i) {
        cache.set(i, i * 2);
        CHECK(cache.size() <= cache.limit() + cache.batch());
    }
    CHECK(cache.stats().evictions > 0);
    CHECK(cache.contains(999));
}

TEST_CASE("overflow drops a batch of least recently used entries") {
    LruCache<std::string, int> cache{4, 2};
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    cache.set("d", 4);
    cache.set("e", 5);

    CHECK(cache.size() == 3);
    CHECK_FALSE(cache.contains("a"));
    CHECK_FALSE(cache.contains("b"));
    CHECK(cache.contains("e"));
    CHECK(cache.stats().evictions == 2);
}

TEST_CASE("reads refresh recency") {
    LruCache<std::string, int> cache{3, 1};
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);

    REQUIRE(cache.get("a") == 1);
    cache.set("d", 4);

    CHECK(cache.contains("a"));
    CHECK_FALSE(cache.contains("b"));
}

TEST_CASE("writes to an existing key refresh recency and replace the value") {
    LruCache<std::string, int> cache{3, 1};
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    cache.set("a", 10);
    cache.set("d", 4);

    CHECK(cache.get("a") == 10);
    CHECK_FALSE(cache.contains("b"));
    CHECK(cache.size() == 3);
}

TEST_CASE("statistics count hits and misses") {
    LruCache<int, std::string> cache;
    cache.set(1, "one");
    CHECK(cache.get(1) == std::string{"one"});
    CHECK_FALSE(cache.get(2).has_value());
    CHECK(cache.stats().hits == 1);
    CHECK(cache.stats().misses == 1);

    cache.resetStats();
    CHECK(cache.stats().hits == 0);
}

TEST_CASE("erase, clear and reconfigure") {
    LruCache<int, int> cache{10, 2};
    for (int i = 0; i < 8; ++i) {
        cache.set(i, i);
    }
    CHECK(cache.erase(3));
    CHECK_FALSE(cache.erase(3));

    cache.reconfigure(4, 2);
    CHECK(cache.size() <= 4);
    CHECK(cache.contains(7));

    cache.clear();
    CHECK(cache.size() == 0);
}

} // TEST_SUITE
