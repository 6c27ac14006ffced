// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bounded_buffer.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

namespace rubicid {

using namespace std::chrono_literals;

TEST_CASE("BoundedBuffer can initialize", "[rubicid][infra][common][bounded_buffer]") {
    BoundedBuffer<int> buffer(10);
    CHECK(buffer.size() == 0);
    CHECK(buffer.capacity() == 10);
    CHECK_FALSE(buffer.is_stopped());
}

TEST_CASE("BoundedBuffer keeps FIFO order", "[rubicid][infra][common][bounded_buffer]") {
    BoundedBuffer<std::string> buffer(3);
    CHECK(buffer.push_front("a"));
    CHECK(buffer.push_front("b"));
    CHECK(buffer.push_front("c"));
    CHECK(buffer.size() == 3);

    std::string item;
    CHECK(buffer.pop_back(&item));
    CHECK(item == "a");
    CHECK(buffer.push_front("d"));
    CHECK(buffer.pop_back(&item));
    CHECK(item == "b");
    CHECK(buffer.pop_back(&item));
    CHECK(item == "c");
    CHECK(buffer.pop_back(&item));
    CHECK(item == "d");
    CHECK(buffer.size() == 0);
}

TEST_CASE("BoundedBuffer blocks producer when full", "[rubicid][infra][common][bounded_buffer]") {
    BoundedBuffer<int> buffer(2);
    CHECK(buffer.push_front(1));
    CHECK(buffer.push_front(2));

    std::atomic_bool pushed{false};
    std::thread producer{[&]() {
        buffer.push_front(3);
        pushed = true;
    }};
    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(pushed);

    int item{0};
    CHECK(buffer.pop_back(&item));
    CHECK(item == 1);
    producer.join();
    CHECK(pushed);
    CHECK(buffer.size() == 2);
}

TEST_CASE("BoundedBuffer terminate releases waiters", "[rubicid][infra][common][bounded_buffer]") {
    BoundedBuffer<int> buffer(1);

    SECTION("blocked consumer") {
        std::atomic_bool popped{true};
        std::thread consumer{[&]() {
            int item{0};
            popped = buffer.pop_back(&item);
        }};
        std::this_thread::sleep_for(20ms);
        buffer.terminate_and_release_all();
        consumer.join();
        CHECK_FALSE(popped);
    }

    SECTION("blocked producer") {
        CHECK(buffer.push_front(1));
        std::atomic_bool pushed{true};
        std::thread producer{[&]() { pushed = buffer.push_front(2); }};
        std::this_thread::sleep_for(20ms);
        buffer.terminate_and_release_all();
        producer.join();
        CHECK_FALSE(pushed);
        CHECK(buffer.is_stopped());
    }
}

TEST_CASE("BoundedBuffer multiple producers single consumer", "[rubicid][infra][common][bounded_buffer]") {
    static constexpr int kProducers{4};
    static constexpr int kItemsPerProducer{1000};
    BoundedBuffer<int> buffer(16);

    std::vector<std::thread> producers;
    for (int p{0}; p < kProducers; ++p) {
        producers.emplace_back([&buffer]() {
            for (int i{0}; i < kItemsPerProducer; ++i) {
                buffer.push_front(1);
            }
        });
    }
    int total{0};
    for (int i{0}; i < kProducers * kItemsPerProducer; ++i) {
        int item{0};
        REQUIRE(buffer.pop_back(&item));
        total += item;
    }
    for (auto& producer : producers) {
        producer.join();
    }
    CHECK(total == kProducers * kItemsPerProducer);
    CHECK(buffer.size() == 0);
}

}  // namespace rubicid
