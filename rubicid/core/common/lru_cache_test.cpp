// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "lru_cache.hpp"

#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

namespace rubicid {

TEST_CASE("LruCache: capacity", "[rubicid][core][common][lru_cache]") {
    CHECK_THROWS_AS((LruCache<int, int>{0}), std::invalid_argument);

    LruCache<std::string, int> cache{3};
    CHECK(cache.max_size() == 3);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    CHECK(cache.size() == 3);

    SECTION("inserting past capacity evicts the least recently used") {
        cache.put("d", 4);
        CHECK(cache.size() == 3);
        CHECK_FALSE(cache.contains("a"));
        CHECK(cache.contains("b"));
        CHECK(cache.contains("d"));
        CHECK(cache.stats().evictions == 1);
    }

    SECTION("access before eviction keeps the entry resident") {
        CHECK(cache.get_as_copy("a") == 1);
        cache.put("d", 4);
        CHECK(cache.contains("a"));
        CHECK_FALSE(cache.contains("b"));
    }

    SECTION("contains does not refresh recency") {
        CHECK(cache.contains("a"));
        cache.put("d", 4);
        CHECK_FALSE(cache.contains("a"));
    }

    SECTION("put on existing key refreshes without eviction") {
        cache.put("a", 10);
        CHECK(cache.size() == 3);
        cache.put("d", 4);
        CHECK(cache.get_as_copy("a") == 10);
        CHECK_FALSE(cache.contains("b"));
    }

    SECTION("clear") {
        cache.clear();
        CHECK(cache.size() == 0);
        CHECK_FALSE(cache.get_as_copy("a"));
    }
}

TEST_CASE("LruCache: stats", "[rubicid][core][common][lru_cache]") {
    LruCache<int, int> cache{2};
    cache.put(1, 100);
    CHECK(cache.get_as_copy(1) == 100);
    CHECK_FALSE(cache.get_as_copy(2));
    const auto stats{cache.stats()};
    CHECK(stats.hits == 1);
    CHECK(stats.misses == 1);
    CHECK(stats.evictions == 0);
}

TEST_CASE("LruCache: concurrent access", "[rubicid][core][common][lru_cache]") {
    LruCache<int, int> cache{100};
    std::vector<std::thread> threads;
    for (int t{0}; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i{0}; i < 1000; ++i) {
                cache.put(t * 1000 + i, i);
                (void)cache.get_as_copy(t * 1000 + i / 2);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(cache.size() == 100);
}

}  // namespace rubicid
