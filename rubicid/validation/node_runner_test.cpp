// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "node_runner.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::validation {

static std::vector<ledger::NodeLayout> make_nodes(int count) {
    std::vector<ledger::NodeLayout> nodes;
    for (int i{1}; i <= count; ++i) {
        nodes.push_back({.name = "node00" + std::to_string(i)});
    }
    return nodes;
}

TEST_CASE("run_nodes", "[rubicid][validation][node_runner]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("no nodes") {
        CHECK(run_nodes({}, [](const auto&) { return NodeStats{}; }, 4).empty());
    }

    SECTION("failing node does not stop the others") {
        const auto nodes{make_nodes(5)};
        std::atomic_int running{0};
        std::atomic_int max_running{0};
        const NodeWorkflow workflow = [&](const ledger::NodeLayout& node) {
            const int now_running{++running};
            int expected{max_running.load()};
            while (now_running > expected && !max_running.compare_exchange_weak(expected, now_running)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
            --running;
            if (node.name == "node003") throw std::runtime_error{"ledger unavailable"};
            return NodeStats{.processed = 3, .pinned = 1, .invalid = 2, .errors = 0};
        };

        const size_t concurrency = GENERATE(1, 2, 8);
        const auto reports{run_nodes(nodes, workflow, concurrency)};
        REQUIRE(reports.size() == nodes.size());
        for (size_t i{0}; i < nodes.size(); ++i) {
            CHECK(reports[i].node_name == nodes[i].name);
        }
        CHECK_FALSE(reports[2].stats);
        CHECK(reports[2].error == "ledger unavailable");
        CHECK(max_running.load() <= static_cast<int>(concurrency));
        CHECK(total_stats(reports) == NodeStats{.processed = 12, .pinned = 4, .invalid = 8, .errors = 0});
    }
}

}  // namespace rubicid::validation
