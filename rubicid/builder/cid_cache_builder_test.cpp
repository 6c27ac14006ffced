// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cid_cache_builder.hpp"

#include <atomic>
#include <csignal>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/concurrency/signal_handler.hpp>
#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::builder {

TEST_CASE("resolve_build_range", "[rubicid][builder][cid_cache]") {
    CHECK(resolve_build_range(1, 1, 100) == db::TokenRange{1, 1, 100});
    CHECK(resolve_build_range(4, 2'188'000, 3'000'000) == db::TokenRange{4, 2'188'000, 2'188'563});
    CHECK_THROWS_AS(resolve_build_range(0, 1, 100), std::invalid_argument);
    CHECK_THROWS_AS(resolve_build_range(5, 1, 100), std::invalid_argument);
    CHECK_THROWS_AS(resolve_build_range(1, 0, 100), std::invalid_argument);
    CHECK_THROWS_AS(resolve_build_range(1, 101, 100), std::invalid_argument);
    CHECK_THROWS_AS(resolve_build_range(4, 2'188'564, 3'000'000), std::invalid_argument);
}

TEST_CASE("split_range", "[rubicid][builder][cid_cache]") {
    SECTION("even split") {
        const auto slices{split_range({2, 1, 9}, 3)};
        CHECK(slices == std::vector<db::TokenRange>{{2, 1, 3}, {2, 4, 6}, {2, 7, 9}});
    }
    SECTION("remainder goes to the first slices") {
        const auto slices{split_range({2, 10, 20}, 3)};
        CHECK(slices == std::vector<db::TokenRange>{{2, 10, 13}, {2, 14, 17}, {2, 18, 20}});
    }
    SECTION("more parts than numbers") {
        const auto slices{split_range({1, 5, 6}, 8)};
        CHECK(slices == std::vector<db::TokenRange>{{1, 5, 5}, {1, 6, 6}});
    }
    SECTION("single part") {
        CHECK(split_range({1, 5, 6}, 1) == std::vector<db::TokenRange>{{1, 5, 6}});
        CHECK(split_range({1, 5, 6}, 0).empty());
    }
}

//! Storage client computing a fake cid from the content, shared state across producers
struct FakeNetwork {
    std::mutex mutex;
    std::set<std::string> rejected_contents;
    std::atomic_int clients{0};
    std::atomic_int add_calls{0};
    std::optional<ipfs::AddOptions> last_options;
};

class FakeAddClient : public ipfs::StorageClient {
  public:
    explicit FakeAddClient(FakeNetwork& network) : network_{network} { ++network_.clients; }

    std::string fetch(std::string_view) override { throw ipfs::FetchError{"unsupported"}; }
    std::string add(std::string_view content, const ipfs::AddOptions& options) override {
        ++network_.add_calls;
        std::scoped_lock lock{network_.mutex};
        network_.last_options = options;
        if (network_.rejected_contents.contains(std::string{content})) throw ipfs::AddError{"add timed out"};
        return "cid-" + std::string{content};
    }
    bool is_pinned(std::string_view) override { return false; }
    void pin(std::string_view) override { throw ipfs::PinError{"unsupported"}; }

  private:
    FakeNetwork& network_;
};

struct CidCacheBuilderTest {
    CidCacheBuilderTest() {
        builder.emplace(writer, [&]() { return std::make_unique<FakeAddClient>(network); });
    }

    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    TemporaryDirectory tmp_dir;
    ::mdbx::env_managed env{db::open_env(db::EnvConfig{.path = tmp_dir.path().string(), .create = true, .inmemory = true})};
    db::CidCacheWriter writer{env};
    db::CidCacheReader reader{env};
    FakeNetwork network;
    std::optional<CidCacheBuilder> builder;
};

static std::string content_of(TokenLevel level, TokenNumber number) {
    return make_token_content({level, number}).to_string();
}

TEST_CASE_METHOD(CidCacheBuilderTest, "CidCacheBuilder::build", "[rubicid][builder][cid_cache]") {
    const CidCacheBuildSettings settings{.level = 3, .start = 100, .end = 349, .num_workers = 4, .batch_size = 32,
                                         .queue_size = 8};

    SECTION("whole range") {
        const auto result{builder->build(settings)};
        CHECK(result.range == db::TokenRange{3, 100, 349});
        CHECK(result.added == 250);
        CHECK(result.failed == 0);
        CHECK(result.inserted == 250);
        CHECK(result.already_present == 0);
        CHECK(result.completed);
        CHECK(network.clients == 4);
        CHECK(network.add_calls == 250);
        REQUIRE(network.last_options);
        CHECK(network.last_options->only_hash);
        CHECK_FALSE(network.last_options->pin);

        CHECK(writer.size() == 250);
        const auto cid{"cid-" + content_of(3, 100)};
        const auto entry{reader.get(cid)};
        REQUIRE(entry);
        CHECK(entry->content == content_of(3, 100));
        CHECK(entry->key == TokenKey{3, 100});

        const auto ranges{writer.completed_ranges()};
        REQUIRE(ranges.size() == 1);
        CHECK(ranges[0].range == db::TokenRange{3, 100, 349});
        CHECK(ranges[0].completed_at > 0);
    }

    SECTION("rerun over overlapping range is idempotent") {
        builder->build(settings);
        CidCacheBuildSettings overlapping{settings};
        overlapping.start = 300;
        overlapping.end = 399;
        const auto result{builder->build(overlapping)};
        CHECK(result.inserted == 50);
        CHECK(result.already_present == 50);
        CHECK(writer.size() == 300);
        CHECK(writer.completed_ranges().size() == 2);
    }

    SECTION("rejected tokens are skipped") {
        network.rejected_contents = {content_of(3, 120), content_of(3, 300)};
        const auto result{builder->build(settings)};
        CHECK(result.added == 248);
        CHECK(result.failed == 2);
        CHECK(result.inserted == 248);
        CHECK_FALSE(result.completed);
        CHECK_FALSE(reader.get("cid-" + content_of(3, 120)));
        CHECK(reader.get("cid-" + content_of(3, 121)));
        CHECK(writer.completed_ranges().empty());

        // A later pass over the same range fills the gaps
        network.rejected_contents.clear();
        const auto retry{builder->build(settings)};
        CHECK(retry.inserted == 2);
        CHECK(retry.already_present == 248);
        CHECK(retry.completed);
    }

    SECTION("end is clamped to the level limit") {
        CidCacheBuildSettings clamped{settings};
        clamped.level = 4;
        clamped.start = 2'188'560;
        clamped.end = 2'188'600;
        const auto result{builder->build(clamped)};
        CHECK(result.range == db::TokenRange{4, 2'188'560, 2'188'563});
        CHECK(result.inserted == 4);
        CHECK(network.clients == 4);
    }

    SECTION("interrupted build is not recorded") {
        SignalHandler::init(/*silent=*/true);
        REQUIRE(std::raise(SIGINT) == 0);
        const auto result{builder->build(settings)};
        SignalHandler::reset();
        CHECK_FALSE(result.completed);
        CHECK(result.added == 0);
        CHECK(writer.completed_ranges().empty());
    }

    SECTION("failing client factory") {
        CidCacheBuilder failing_builder{writer, []() -> std::unique_ptr<ipfs::StorageClient> {
                                            throw ipfs::StorageError{"ipfs binary not found"};
                                        }};
        CHECK_THROWS_AS(failing_builder.build(settings), ipfs::StorageError);
        CHECK(writer.completed_ranges().empty());
    }

    SECTION("invalid settings") {
        CidCacheBuildSettings invalid{settings};
        invalid.batch_size = 0;
        CHECK_THROWS_AS(builder->build(invalid), std::invalid_argument);
        invalid = settings;
        invalid.start = 0;
        CHECK_THROWS_AS(builder->build(invalid), std::invalid_argument);
        CHECK(network.add_calls == 0);
    }
}

}  // namespace rubicid::builder
