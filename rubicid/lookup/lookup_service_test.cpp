// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "lookup_service.hpp"

#include <map>

#include <catch2/catch.hpp>

#include <rubicid/db/errors.hpp>

namespace rubicid::lookup {

//! Cache source counting every read
class FakeCidCacheSource : public db::CidCacheSource {
  public:
    std::optional<db::CidCacheEntry> get(std::string_view cid) override {
        ++get_calls;
        if (failing) throw db::PersistenceError{"disk failure"};
        const auto it{entries.find(std::string{cid})};
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }
    std::vector<db::CidCacheEntry> get_many(const std::vector<std::string>& cids) override {
        ++get_many_calls;
        last_get_many = cids;
        if (failing) throw db::PersistenceError{"disk failure"};
        std::vector<db::CidCacheEntry> found;
        for (const auto& cid : cids) {
            if (const auto it{entries.find(cid)}; it != entries.end()) found.push_back(it->second);
        }
        return found;
    }
    bool ping() override { return !failing; }

    void add(const db::CidCacheEntry& entry) { entries[entry.cid] = entry; }

    std::map<std::string, db::CidCacheEntry> entries;
    std::vector<std::string> last_get_many;
    int get_calls{0};
    int get_many_calls{0};
    bool failing{false};
};

static const db::CidCacheEntry kEntryA{
    .cid = "QmeoeiBuMJbjaCqfbhEcbvwt3EV9E3iDhhD1yYrxBbZain",
    .content = "003f4a5ac9cd7498503f8ab1b5f4f62454703e3cfef47886861d776819d3be9fdbb",
    .key = {.level = 3, .number = 1'662'242},
};
static const db::CidCacheEntry kEntryC{
    .cid = "QmVaPTddRyjLjMoZnYufWc5M5CjyGNPmFEpp5HtPKEqZFG",
    .content = "0016b86b273ff34fce19d6b804eff5a3f5747ada4eaa22f1d49c01e52ddb7875b4b",
    .key = {.level = 1, .number = 1},
};
static const std::string kCidB{"QmMissingB"};

TEST_CASE("LookupService::get_one", "[rubicid][lookup][lookup_service]") {
    FakeCidCacheSource source;
    source.add(kEntryA);
    HotCache cache{10};
    LookupService service{source, cache};

    CHECK(service.get_one(kEntryA.cid) == kEntryA);
    CHECK(source.get_calls == 1);
    CHECK(cache.contains(kEntryA.cid));

    SECTION("cache hit avoids any source read") {
        source.entries.clear();
        CHECK(service.get_one(kEntryA.cid) == kEntryA);
        CHECK(source.get_calls == 1);
    }

    SECTION("missing entry is not cached") {
        CHECK_FALSE(service.get_one(kCidB));
        CHECK_FALSE(service.get_one(kCidB));
        CHECK(source.get_calls == 3);
        CHECK_FALSE(cache.contains(kCidB));
    }

    SECTION("persistence failure propagates") {
        source.failing = true;
        CHECK_THROWS_AS(service.get_one(kEntryC.cid), db::PersistenceError);
        CHECK_FALSE(service.health());
    }

    SECTION("health") {
        CHECK(service.health());
    }
}

TEST_CASE("LookupService::get_batch", "[rubicid][lookup][lookup_service]") {
    FakeCidCacheSource source;
    source.add(kEntryA);
    source.add(kEntryC);
    HotCache cache{10};
    LookupService service{source, cache, /*max_batch_size=*/4};

    SECTION("found and not found partition") {
        const auto result{service.get_batch({kEntryA.cid, kCidB})};
        CHECK(result.total_requested == 2);
        CHECK(result.total_found() == 1);
        CHECK(result.total_not_found() == 1);
        REQUIRE(result.results.size() == 1);
        CHECK(result.results[0] == kEntryA);
        CHECK(result.not_found == std::vector<std::string>{kCidB});
        CHECK(source.get_many_calls == 1);
    }

    SECTION("duplicates are resolved once") {
        const auto result{service.get_batch({kCidB, kEntryA.cid, kCidB, kEntryA.cid})};
        CHECK(result.total_requested == 4);
        CHECK(result.total_found() == 1);
        CHECK(result.total_not_found() == 1);
        CHECK(source.last_get_many == std::vector<std::string>{kCidB, kEntryA.cid});
    }

    SECTION("cached entries are not queried again") {
        CHECK(service.get_one(kEntryA.cid));
        const auto result{service.get_batch({kEntryC.cid, kEntryA.cid})};
        CHECK(source.last_get_many == std::vector<std::string>{kEntryC.cid});
        REQUIRE(result.results.size() == 2);
        CHECK(result.results[0] == kEntryC);
        CHECK(result.results[1] == kEntryA);
        CHECK(cache.contains(kEntryC.cid));

        const auto cached_result{service.get_batch({kEntryA.cid, kEntryC.cid})};
        CHECK(cached_result.total_found() == 2);
        CHECK(source.get_many_calls == 1);
    }

    SECTION("empty batch") {
        const auto result{service.get_batch({})};
        CHECK(result.total_requested == 0);
        CHECK(result.results.empty());
        CHECK(result.not_found.empty());
        CHECK(source.get_many_calls == 0);
    }

    SECTION("oversized batch") {
        const std::vector<std::string> cids(5, kEntryA.cid);
        CHECK_THROWS_AS(service.get_batch(cids), BatchTooLargeError);
        try {
            service.get_batch(cids);
        } catch (const BatchTooLargeError& ex) {
            CHECK(ex.max_size() == 4);
            CHECK(ex.received() == 5);
        }
        CHECK(source.get_many_calls == 0);
    }
}

}  // namespace rubicid::lookup
