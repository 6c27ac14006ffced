// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cid_cache.hpp"

#include <catch2/catch.hpp>

#include <rubicid/core/types/cid.hpp>
#include <rubicid/db/errors.hpp>
#include <rubicid/db/tables.hpp>
#include <rubicid/infra/common/directories.hpp>

namespace rubicid::db {

static CidCacheEntry make_entry(TokenLevel level, TokenNumber number) {
    const auto content{make_token_content({.level = level, .number = number})};
    return {
        .cid = digest_to_cidv0(content.hash),
        .content = content.to_string(),
        .key = {.level = level, .number = number},
    };
}

//! Create the named table with duplicate values so that opening it with the regular layout fails
static void create_incompatible_table(::mdbx::env& env, const char* name) {
    RWTxn txn{env};
    open_map(*txn, MapConfig{name, ::mdbx::key_mode::usual, ::mdbx::value_mode::multi});
    txn.commit(/*renew=*/false);
}

TEST_CASE("cid cache value layout", "[rubicid][db][cid_cache]") {
    const auto entry{make_entry(3, 1'662'242)};
    const auto value{encode_cid_cache_value(entry)};
    CHECK(value.size() == 1 + 4 + kTokenContentLength);
    CHECK(value.substr(0, 5) == Bytes{0x03, 0x00, 0x19, 0x5d, 0x22});
    CHECK(decode_cid_cache_value(entry.cid, value) == entry);
    CHECK_FALSE(decode_cid_cache_value(entry.cid, value.substr(1)));
}

TEST_CASE("TokenRange", "[rubicid][db][cid_cache]") {
    CHECK(TokenRange{.level = 1, .start = 1, .end = 10}.count() == 10);
    CHECK(TokenRange{.level = 1, .start = 5, .end = 5}.count() == 1);
    CHECK(TokenRange{.level = 1, .start = 6, .end = 5}.count() == 0);
}

TEST_CASE("CidCacheWriter and CidCacheReader", "[rubicid][db][cid_cache]") {
    const TemporaryDirectory tmp_dir;
    auto env{open_env(EnvConfig{.path = tmp_dir.path().string(), .create = true, .inmemory = true})};
    CidCacheWriter writer{env};
    CidCacheReader reader{env};

    const auto a{make_entry(3, 1'662'242)};
    const auto b{make_entry(1, 7)};
    const auto c{make_entry(2, 8)};

    SECTION("reads before any write") {
        CHECK_FALSE(reader.get(a.cid));
        CHECK(reader.get_many({a.cid, b.cid}).empty());
        CHECK(reader.ping());
        CHECK(writer.size() == 0);
    }

    SECTION("insert and read back") {
        const auto result{writer.commit_batch({a, b})};
        CHECK(result.inserted == 2);
        CHECK(result.already_present == 0);
        CHECK(writer.size() == 2);

        CHECK(reader.get(a.cid) == a);
        CHECK_FALSE(reader.get(c.cid));

        const auto found{reader.get_many({b.cid, c.cid, a.cid})};
        REQUIRE(found.size() == 2);
        CHECK(found[0] == b);
        CHECK(found[1] == a);
    }

    SECTION("insert-if-absent keeps the first value") {
        (void)writer.commit_batch({a, b});
        auto altered{a};
        altered.key.number = 1;
        const auto result{writer.commit_batch({altered, c})};
        CHECK(result.inserted == 1);
        CHECK(result.already_present == 1);
        CHECK(writer.size() == 3);
        CHECK(reader.get(a.cid) == a);
    }

    SECTION("reader sees writes committed after its first query") {
        CHECK_FALSE(reader.get(a.cid));
        (void)writer.commit_batch({a});
        CHECK(reader.get(a.cid) == a);
    }

    SECTION("completed ranges") {
        CHECK(writer.completed_ranges().empty());
        writer.record_range({.level = 2, .start = 1, .end = 5000}, 1'700'000'000);
        writer.record_range({.level = 1, .start = 5001, .end = 10000}, 1'700'000'100);
        const auto ranges{writer.completed_ranges()};
        REQUIRE(ranges.size() == 2);
        CHECK(ranges[0].range == TokenRange{.level = 1, .start = 5001, .end = 10000});
        CHECK(ranges[0].completed_at == 1'700'000'100);
        CHECK(ranges[1].range == TokenRange{.level = 2, .start = 1, .end = 5000});
    }
}

TEST_CASE("CidCacheWriter: storage failures surface as PersistenceError", "[rubicid][db][cid_cache]") {
    const TemporaryDirectory tmp_dir;
    auto env{open_env(EnvConfig{.path = tmp_dir.path().string(), .create = true, .inmemory = true})};
    create_incompatible_table(env, table::kCidCache.name);
    create_incompatible_table(env, table::kCidCacheRanges.name);
    CidCacheWriter writer{env};

    CHECK_THROWS_AS(writer.size(), PersistenceError);
    CHECK_THROWS_AS(writer.completed_ranges(), PersistenceError);
}

}  // namespace rubicid::db
