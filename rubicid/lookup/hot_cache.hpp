// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>

#include <rubicid/core/common/lru_cache.hpp>
#include <rubicid/db/cid_cache.hpp>

namespace rubicid::lookup {

inline constexpr size_t kDefaultHotCacheSize{100'000};

//! Process-wide cache of the most recently requested entries keyed by cid, shared among serving contexts
//! \details Cached entries are immutable once written, so capacity is the only eviction reason
using HotCache = LruCache<std::string, db::CidCacheEntry>;

}  // namespace rubicid::lookup
