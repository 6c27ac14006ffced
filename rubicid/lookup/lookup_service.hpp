// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <rubicid/db/cid_cache.hpp>
#include <rubicid/lookup/hot_cache.hpp>

namespace rubicid::lookup {

inline constexpr size_t kDefaultMaxBatchSize{10'000};

//! \brief Malformed or oversized lookup request
class RequestValidationError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

class BatchTooLargeError : public RequestValidationError {
  public:
    BatchTooLargeError(size_t max_size, size_t received);

    size_t max_size() const noexcept { return max_size_; }
    size_t received() const noexcept { return received_; }

  private:
    size_t max_size_;
    size_t received_;
};

struct BatchLookupResult {
    std::vector<db::CidCacheEntry> results;  // found entries in request order, without duplicates
    std::vector<std::string> not_found;      // missing cids in request order, without duplicates
    size_t total_requested{0};               // size of the request including duplicates

    size_t total_found() const noexcept { return results.size(); }
    size_t total_not_found() const noexcept { return not_found.size(); }
};

//! \brief Read-only lookup of cached tokens by cid for one serving context
//! \details The source is owned by the serving context and never shared, the hot cache is shared by all contexts.
class LookupService {
  public:
    LookupService(db::CidCacheSource& source, HotCache& cache, size_t max_batch_size = kDefaultMaxBatchSize)
        : source_{source}, cache_{cache}, max_batch_size_{max_batch_size} {}

    LookupService(const LookupService&) = delete;
    LookupService& operator=(const LookupService&) = delete;

    //! \throws db::PersistenceError
    std::optional<db::CidCacheEntry> get_one(std::string_view cid);

    //! \throws BatchTooLargeError if more than max batch size cids are requested
    //! \throws db::PersistenceError
    BatchLookupResult get_batch(const std::vector<std::string>& cids);

    //! \brief Liveness plus trivial persistence check
    bool health();

    size_t max_batch_size() const noexcept { return max_batch_size_; }

  private:
    db::CidCacheSource& source_;
    HotCache& cache_;
    size_t max_batch_size_;
};

}  // namespace rubicid::lookup
