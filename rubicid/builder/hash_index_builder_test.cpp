// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_index_builder.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::builder {

TEST_CASE("max_number_for_levels", "[rubicid][builder][hash_index]") {
    CHECK(max_number_for_levels({1, 2, 3, 4}) == 4'300'000);
    CHECK(max_number_for_levels({3, 4}) == 2'303'750);
    CHECK(max_number_for_levels({4}) == 2'188'563);
    CHECK_THROWS_AS(max_number_for_levels({}), std::invalid_argument);
    CHECK_THROWS_AS(max_number_for_levels({0}), std::invalid_argument);
    CHECK_THROWS_AS(max_number_for_levels({2, 5}), std::invalid_argument);

    CHECK(effective_last_number({4}, std::nullopt) == 2'188'563);
    CHECK(effective_last_number({4}, 1'000) == 1'000);
    CHECK(effective_last_number({4}, 3'000'000) == 2'188'563);
    CHECK_THROWS_AS(effective_last_number({4}, 0), std::invalid_argument);
}

TEST_CASE("derive_hash_index_entries", "[rubicid][builder][hash_index]") {
    const auto entries{derive_hash_index_entries(2'188'562, 2'188'565)};
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].key == TokenKey{4, 2'188'562});
    CHECK(entries[1].key == TokenKey{4, 2'188'563});
    CHECK(entries[2].key == TokenKey{3, 2'188'564});
    CHECK(entries[3].key == TokenKey{3, 2'188'565});
    CHECK(entries[1].hash == token_hash(2'188'563));
}

TEST_CASE("HashIndexBuilder", "[rubicid][builder][hash_index]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    auto env{db::open_env(db::EnvConfig{.path = tmp_dir.path().string(), .create = true, .inmemory = true})};
    db::HashIndex index{env};
    HashIndexBuilder builder{index};

    const HashIndexBuildSettings settings{.last_number = 2'500, .batch_size = 300, .num_workers = 3};

    SECTION("build from empty") {
        const auto result{builder.build(settings)};
        CHECK(result.first_number == 1);
        CHECK(result.watermark == 2'500);
        CHECK(result.written == 2'500);
        CHECK(result.completed);
        CHECK(index.size() == 2'500);
        CHECK(index.watermark() == 2'500);
        CHECK(index.lookup(token_hash(1)) == TokenKey{4, 1});
        CHECK(index.lookup(token_hash(2'500)) == TokenKey{4, 2'500});
        CHECK_FALSE(index.lookup(token_hash(2'501)));
    }

    SECTION("rebuild is a no-op") {
        builder.build(settings);
        const auto result{builder.build(settings)};
        CHECK(result.completed);
        CHECK(result.written == 0);
        CHECK(result.first_number == 0);
        CHECK(index.size() == 2'500);
    }

    SECTION("resume from watermark") {
        HashIndexBuildSettings partial{settings};
        partial.last_number = 1'000;
        CHECK(builder.build(partial).watermark == 1'000);

        const auto result{builder.build(settings)};
        CHECK(result.first_number == 1'001);
        CHECK(result.written == 1'500);
        CHECK(index.size() == 2'500);
    }

    SECTION("force rebuilds from empty") {
        builder.build(settings);
        HashIndexBuildSettings forced{settings};
        forced.force = true;
        forced.last_number = 100;
        const auto result{builder.build(forced)};
        CHECK(result.first_number == 1);
        CHECK(result.written == 100);
        CHECK(index.size() == 100);
        CHECK(index.watermark() == 100);
    }

    SECTION("invalid settings") {
        HashIndexBuildSettings invalid{settings};
        invalid.batch_size = 0;
        CHECK_THROWS_AS(builder.build(invalid), std::invalid_argument);
        invalid = settings;
        invalid.levels = {7};
        CHECK_THROWS_AS(builder.build(invalid), std::invalid_argument);
        CHECK(index.size() == 0);
    }

    SECTION("verify") {
        builder.build(settings);

        const auto full_report{builder.verify({.last_number = 2'500, .full = true})};
        CHECK(full_report.checked == 2'500);
        CHECK(full_report.entries == 2'500);
        CHECK(full_report.expected_entries == 2'500);
        CHECK(full_report.ok());

        const auto sample_report{builder.verify({.last_number = 2'500, .sample_size = 50, .seed = 42})};
        CHECK(sample_report.checked > 0);
        CHECK(sample_report.checked <= 52);
        CHECK(sample_report.ok());

        // Entries missing beyond the build bound
        const auto wider_report{builder.verify({.last_number = 3'000, .full = true})};
        CHECK(wider_report.checked == 3'000);
        CHECK(wider_report.missing == 500);
        CHECK(wider_report.mismatched == 0);
        CHECK_FALSE(wider_report.ok());
    }

    SECTION("verify detects mismatched entries") {
        builder.build(settings);
        index.put_batch({{token_hash(7), TokenKey{1, 8}}}, index.watermark());
        const auto report{builder.verify({.last_number = 2'500, .full = true})};
        CHECK(report.mismatched == 1);
        CHECK(report.missing == 0);
        CHECK_FALSE(report.ok());
    }
}

}  // namespace rubicid::builder
