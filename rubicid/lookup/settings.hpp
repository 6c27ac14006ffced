// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/context_pool_settings.hpp>
#include <rubicid/lookup/hot_cache.hpp>
#include <rubicid/lookup/lookup_service.hpp>

namespace rubicid::lookup {

inline constexpr std::string_view kDefaultHttpEndPoint{"0.0.0.0:5000"};

struct DaemonSettings {
    log::Settings log_settings;
    concurrency::ContextPoolSettings context_pool_settings;
    std::filesystem::path data_dir;
    std::string http_end_point{kDefaultHttpEndPoint};
    size_t hot_cache_size{kDefaultHotCacheSize};
    size_t max_batch_size{kDefaultMaxBatchSize};
};

}  // namespace rubicid::lookup
