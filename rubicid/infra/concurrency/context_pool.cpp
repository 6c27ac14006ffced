// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <sstream>
#include <thread>

namespace rubicid::concurrency {

std::ostream& operator<<(std::ostream& out, const Context& c) {
    out << c.to_string();
    return out;
}

Context::Context(size_t context_id)
    : context_id_{context_id},
      ioc_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::make_work_guard(*ioc_)} {}

std::string Context::to_string() const {
    std::stringstream out;
    out << "io_context: " << ioc() << " id: " << id();
    return out.str();
}

void Context::execute_loop() {
    RCID_DEBUG << "Context execution loop start [" << std::this_thread::get_id() << "]";
    ioc_->run();
    RCID_DEBUG << "Context execution loop end [" << std::this_thread::get_id() << "]";
}

void Context::stop() {
    ioc_->stop();
}

ContextPool::ContextPool(ContextPoolSettings settings) {
    if (settings.num_contexts == 0) {
        throw std::logic_error("ContextPool size is 0");
    }
    contexts_.reserve(settings.num_contexts);
    for (size_t i{0}; i < settings.num_contexts; ++i) {
        contexts_.emplace_back(i);
    }
}

ContextPool::~ContextPool() {
    RCID_TRACE << "ContextPool::~ContextPool START " << this;
    stop();
    join();
    RCID_TRACE << "ContextPool::~ContextPool END " << this;
}

void ContextPool::start() {
    RCID_TRACE << "ContextPool::start START";
    for (size_t i{0}; i < contexts_.size(); ++i) {
        auto& context = contexts_[i];
        context_threads_.create_thread([&, i = i]() {
            log::set_thread_name(("serve_ctx_" + std::to_string(i)).c_str());
            try {
                context.execute_loop();
            } catch (const std::exception& ex) {
                RCID_CRIT << "ContextPool context.execute_loop exception: " << ex.what();
                exception_handler_(std::current_exception());
            }
        });
        RCID_TRACE << "ContextPool::start context[" << i << "] started: " << context.ioc();
    }
    RCID_TRACE << "ContextPool::start END";
}

void ContextPool::join() {
    RCID_TRACE << "ContextPool::join START";
    context_threads_.join();
    RCID_TRACE << "ContextPool::join END";
}

void ContextPool::stop() {
    if (!stopped_.exchange(true)) {
        for (auto& context : contexts_) {
            context.stop();
            RCID_TRACE << "ContextPool::stop " << context << " stopped";
        }
    }
}

Context& ContextPool::next_context() {
    // Increment the next index first to make sure that different calling threads get different contexts.
    const size_t index = next_index_.fetch_add(1) % contexts_.size();
    return contexts_[index];
}

}  // namespace rubicid::concurrency
