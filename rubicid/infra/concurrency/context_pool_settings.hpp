// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <thread>

namespace rubicid::concurrency {

//! Default number of serving contexts (i.e. request-handling threads)
inline const uint32_t kDefaultNumContexts{std::max(1u, std::thread::hardware_concurrency() / 2)};

//! The configuration settings for \refitem ContextPool
struct ContextPoolSettings {
    uint32_t num_contexts{kDefaultNumContexts};  // The number of execution contexts to activate
};

}  // namespace rubicid::concurrency
