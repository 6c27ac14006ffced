// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "lookup_service.hpp"

#include <utility>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <rubicid/infra/common/log.hpp>

namespace rubicid::lookup {

BatchTooLargeError::BatchTooLargeError(size_t max_size, size_t received)
    : RequestValidationError{"Batch size exceeds maximum of " + std::to_string(max_size)},
      max_size_{max_size},
      received_{received} {}

std::optional<db::CidCacheEntry> LookupService::get_one(std::string_view cid) {
    std::string key{cid};
    if (auto cached = cache_.get_as_copy(key)) {
        return cached;
    }
    auto entry{source_.get(cid)};
    if (entry) {
        cache_.put(std::move(key), *entry);
    }
    return entry;
}

BatchLookupResult LookupService::get_batch(const std::vector<std::string>& cids) {
    if (cids.size() > max_batch_size_) {
        throw BatchTooLargeError{max_batch_size_, cids.size()};
    }

    BatchLookupResult result;
    result.total_requested = cids.size();

    std::vector<std::string> unique_cids;
    unique_cids.reserve(cids.size());
    absl::flat_hash_set<std::string_view> seen;
    for (const auto& cid : cids) {
        if (seen.insert(cid).second) {
            unique_cids.push_back(cid);
        }
    }

    absl::flat_hash_map<std::string, db::CidCacheEntry> resolved;
    std::vector<std::string> uncached_cids;
    for (const auto& cid : unique_cids) {
        if (auto cached = cache_.get_as_copy(cid)) {
            resolved.emplace(cid, std::move(*cached));
        } else {
            uncached_cids.push_back(cid);
        }
    }

    if (!uncached_cids.empty()) {
        for (auto& entry : source_.get_many(uncached_cids)) {
            cache_.put(entry.cid, entry);
            auto cid{entry.cid};
            resolved.emplace(std::move(cid), std::move(entry));
        }
    }
    RCID_TRACE << "LookupService::get_batch requested: " << cids.size() << " unique: " << unique_cids.size()
               << " uncached: " << uncached_cids.size();

    for (auto& cid : unique_cids) {
        if (auto it = resolved.find(cid); it != resolved.end()) {
            result.results.push_back(std::move(it->second));
        } else {
            result.not_found.push_back(std::move(cid));
        }
    }
    return result;
}

bool LookupService::health() {
    return source_.ping();
}

}  // namespace rubicid::lookup
