// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <atomic>
#include <set>

#include <boost/asio/post.hpp>
#include <catch2/catch.hpp>

#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::concurrency {

TEST_CASE("Context", "[rubicid][infra][concurrency][context_pool]") {
    Context context{7};
    CHECK(context.id() == 7);
    CHECK(context.ioc() != nullptr);
    CHECK(context.to_string().find("id: 7") != std::string::npos);
}

TEST_CASE("ContextPool", "[rubicid][infra][concurrency][context_pool]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("zero contexts rejected") {
        CHECK_THROWS_AS(ContextPool{ContextPoolSettings{.num_contexts = 0}}, std::logic_error);
    }

    SECTION("round-robin over contexts") {
        ContextPool pool{ContextPoolSettings{.num_contexts = 3}};
        CHECK(pool.size() == 3);
        std::set<boost::asio::io_context*> seen;
        for (size_t i{0}; i < 6; ++i) {
            seen.insert(&pool.next_ioc());
        }
        CHECK(seen.size() == 3);
        CHECK(pool.next_context().id() == 0);
    }

    SECTION("start runs posted work then stop and join") {
        ContextPool pool{ContextPoolSettings{.num_contexts = 2}};
        std::atomic_int executed{0};
        for (size_t i{0}; i < pool.size(); ++i) {
            boost::asio::post(pool.next_ioc(), [&]() { ++executed; });
        }
        pool.start();
        while (executed < 2) {
            std::this_thread::yield();
        }
        pool.stop();
        pool.join();
        CHECK(executed == 2);
    }
}

}  // namespace rubicid::concurrency
