// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <thread>

#include <boost/asio/thread_pool.hpp>

namespace rubicid::concurrency {

//! Default number of threads in worker pool (i.e. all cores but one left to the writer)
inline const uint32_t kDefaultNumWorkers{std::max(2u, std::thread::hardware_concurrency()) - 1};

//! Pool of worker threads dedicated to blocking or CPU-bound tasks
using WorkerPool = boost::asio::thread_pool;

}  // namespace rubicid::concurrency
