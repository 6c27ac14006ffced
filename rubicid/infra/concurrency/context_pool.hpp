// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/detail/thread_group.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/context_pool_settings.hpp>

namespace rubicid::concurrency {

//! Asynchronous scheduler running an execution loop on one dedicated thread.
class Context {
  public:
    explicit Context(size_t context_id);

    boost::asio::io_context* ioc() const noexcept { return ioc_.get(); }
    size_t id() const noexcept { return context_id_; }

    //! Execute the scheduler loop until stopped.
    void execute_loop();

    //! Stop the execution loop.
    void stop();

    std::string to_string() const;

  private:
    //! The unique scheduler identifier.
    size_t context_id_;

    //! The asio asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> ioc_;

    //! The work-tracking executor that keep the asio scheduler running.
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
};

std::ostream& operator<<(std::ostream& out, const Context& c);

//! Pool of \ref Context instances running as separate reactive schedulers.
class ContextPool {
  public:
    using ExceptionHandler = std::function<void(std::exception_ptr)>;

    explicit ContextPool(ContextPoolSettings settings);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    //! Start one execution thread for each context.
    void start();

    //! Wait for termination of all execution threads.
    //!\warning This will block until \ref stop() is called.
    void join();

    //! Stop all execution threads. This does *NOT* wait for termination: use \ref join() for that.
    void stop();

    size_t size() const { return contexts_.size(); }

    //! Use a round-robin scheme to choose the next context to use
    Context& next_context();

    boost::asio::io_context& next_ioc() { return *next_context().ioc(); }

    void set_exception_handler(ExceptionHandler exception_handler) {
        exception_handler_ = std::move(exception_handler);
    }

  private:
    static void termination_handler(std::exception_ptr) { std::terminate(); }

    //! The pool of execution contexts.
    std::vector<Context> contexts_;

    //! The pool of threads running the execution contexts.
    boost::asio::detail::thread_group context_threads_;

    //! The index for obtaining next context to use (round-robin).
    std::atomic_size_t next_index_{0};

    //! Flag indicating if pool has been stopped.
    std::atomic_bool stopped_{false};

    //! Exception handler invoked on execution loop abnormal termination
    ExceptionHandler exception_handler_{termination_handler};
};

}  // namespace rubicid::concurrency
