// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/version.hpp>
#include <boost/process/environment.hpp>

#include <rubicid/db/cid_cache.hpp>
#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/private_service.hpp>
#include <rubicid/infra/concurrency/shared_service.hpp>

namespace rubicid::lookup {

//! The maximum number of concurrent readers allowed for MDBX datastore.
static constexpr int kDatabaseMaxReaders{4096};

int Daemon::run(const DaemonSettings& settings) {
    if (!validate_settings(settings)) {
        return -1;
    }

    const auto mdbx_ver{::mdbx::get_version()};
    RCID_INFO << "Lookup daemon starting, Boost Asio: " << BOOST_ASIO_VERSION << " libmdbx: " << mdbx_ver.git.describe;

    const auto pid = boost::this_process::get_id();
    const auto tid = std::this_thread::get_id();

    int exit_code{0};
    try {
        DataDirectory data_dir{settings.data_dir};
        if (!data_dir.cid_cache().exists()) {
            throw std::runtime_error{"cid cache not found in " + data_dir.cid_cache().path().string()};
        }
        auto env{db::open_env(db::EnvConfig{
            .path = data_dir.cid_cache().path().string(),
            .readonly = true,
            .shared = true,
            .max_readers = kDatabaseMaxReaders,
        })};

        RCID_INFO << "Lookup daemon launched with datadir " << settings.data_dir.string() << " using "
                  << settings.context_pool_settings.num_contexts << " contexts, hot cache size "
                  << settings.hot_cache_size;

        Daemon daemon{settings, env};

        // Start execution context dedicated to handling termination signals
        boost::asio::io_context shutdown_signal_ioc;
        boost::asio::signal_set shutdown_signal{shutdown_signal_ioc, SIGINT, SIGTERM};
        shutdown_signal.async_wait([&](const boost::system::error_code& error, int signal_number) {
            if (signal_number == SIGINT) std::cout << "\n";
            RCID_INFO << "Signal number: " << signal_number << " caught" << (error ? ", error: " + error.message() : "");
            daemon.stop();
        });

        RCID_INFO << "Starting lookup API at " << settings.http_end_point;

        daemon.start();

        RCID_LOG << "Lookup daemon is now running [pid=" << pid << ", main thread=" << tid << "]";

        shutdown_signal_ioc.run();

        daemon.join();
    } catch (const std::exception& e) {
        RCID_CRIT << "Exception: " << e.what();
        exit_code = -1;
    }

    RCID_LOG << "Lookup daemon exiting [pid=" << pid << ", main thread=" << tid << "]";

    return exit_code;
}

bool Daemon::validate_settings(const DaemonSettings& settings) {
    if (settings.http_end_point.empty()) {
        RCID_ERROR << "Parameter http.addr cannot be empty";
        return false;
    }
    if (settings.hot_cache_size == 0) {
        RCID_ERROR << "Parameter cache.size must be positive";
        return false;
    }
    if (settings.max_batch_size == 0) {
        RCID_ERROR << "Parameter batch.max must be positive";
        return false;
    }
    return true;
}

Daemon::Daemon(DaemonSettings settings, ::mdbx::env cid_cache_env)
    : settings_{std::move(settings)},
      cid_cache_env_{std::move(cid_cache_env)},
      context_pool_{settings_.context_pool_settings} {
    add_shared_services();
    add_private_services();
}

void Daemon::add_shared_services() {
    // Create the unique hot cache to be shared among the execution contexts
    auto hot_cache = std::make_shared<HotCache>(settings_.hot_cache_size);

    // Add the shared state to each execution context
    for (size_t i{0}; i < settings_.context_pool_settings.num_contexts; ++i) {
        auto& ioc = context_pool_.next_ioc();
        add_shared_service(ioc, hot_cache);
    }
}

void Daemon::add_private_services() {
    // Add the private state to each execution context: the cache reader must never be shared across threads
    for (size_t i{0}; i < settings_.context_pool_settings.num_contexts; ++i) {
        auto& ioc = context_pool_.next_ioc();

        add_private_service<db::CidCacheSource>(ioc, std::make_unique<db::CidCacheReader>(cid_cache_env_));
        auto* source = must_use_private_service<db::CidCacheSource>(ioc);
        auto* hot_cache = must_use_shared_service<HotCache>(ioc);
        add_private_service(ioc, std::make_unique<LookupService>(*source, *hot_cache, settings_.max_batch_size));
    }
}

void Daemon::start() {
    // Create and start the HTTP server for each execution context
    for (size_t i{0}; i < settings_.context_pool_settings.num_contexts; ++i) {
        auto& ioc = context_pool_.next_ioc();
        auto* service = must_use_private_service<LookupService>(ioc);
        servers_.emplace_back(std::make_unique<http::Server>(settings_.http_end_point, ioc, *service));
    }

    for (auto& server : servers_) {
        server->start();
    }

    context_pool_.start();
}

void Daemon::stop() {
    for (auto& server : servers_) {
        server->stop();
    }
    context_pool_.stop();
}

void Daemon::join() {
    context_pool_.join();
}

}  // namespace rubicid::lookup
