// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <rubicid/db/mdbx.hpp>
#include <rubicid/infra/concurrency/context_pool.hpp>
#include <rubicid/lookup/http/server.hpp>

#include "settings.hpp"

namespace rubicid::lookup {

class Daemon {
  public:
    //! Run the daemon until a termination signal is received, returns the process exit code
    static int run(const DaemonSettings& settings);

    Daemon(DaemonSettings settings, ::mdbx::env cid_cache_env);

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    concurrency::ContextPool& context_pool() { return context_pool_; }

    //! The HTTP servers, one per execution context
    const std::vector<std::unique_ptr<http::Server>>& servers() const { return servers_; }

    void start();
    void stop();

    void join();

  protected:
    static bool validate_settings(const DaemonSettings& settings);

    void add_private_services();
    void add_shared_services();

    //! The lookup daemon configuration settings.
    DaemonSettings settings_;

    //! The read-only environment of the cid cache.
    ::mdbx::env cid_cache_env_;

    //! The execution contexts capturing the asynchronous scheduling model.
    concurrency::ContextPool context_pool_;

    //! The HTTP servers.
    std::vector<std::unique_ptr<http::Server>> servers_;
};

}  // namespace rubicid::lookup
