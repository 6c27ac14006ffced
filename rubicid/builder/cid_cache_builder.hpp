// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include <rubicid/db/cid_cache.hpp>
#include <rubicid/infra/concurrency/worker_pool.hpp>
#include <rubicid/ipfs/storage_client.hpp>

namespace rubicid::builder {

struct CidCacheBuildSettings {
    TokenLevel level{1};
    TokenNumber start{1};
    TokenNumber end{0};  // clamped to the level limit
    size_t num_workers{concurrency::kDefaultNumWorkers};
    size_t batch_size{5'000};
    size_t queue_size{10'000};
    ipfs::AddOptions add_options{.only_hash = true, .pin = false};
};

struct CidCacheBuildResult {
    db::TokenRange range;
    size_t added{0};   // tokens whose cid has been computed by the storage network
    size_t failed{0};  // tokens skipped because the storage network rejected them
    size_t inserted{0};
    size_t already_present{0};
    bool completed{false};  // whole range processed without failure, hence recorded as completed
};

//! Creates one storage client per producer
using StorageClientFactory = std::function<std::unique_ptr<ipfs::StorageClient>()>;

//! \brief Range of the build after validation and clamping of the end to the level limit
//! \throws std::invalid_argument on unknown level or empty range
db::TokenRange resolve_build_range(TokenLevel level, TokenNumber start, TokenNumber end);

//! \brief Split the range into at most \p parts contiguous disjoint slices covering it
std::vector<db::TokenRange> split_range(const db::TokenRange& range, size_t parts);

//! \brief Populates the CidCache for one range of token numbers in one level
//! \details Producers running on a worker pool each own a slice of the range and a storage client: they compute the
//! canonical content of every token, ask the storage network for its cid and hand the entry over to a bounded queue.
//! The calling thread is the only writer: it drains the queue committing fixed size insert-if-absent batches.
//! Producers block when the queue is full.
class CidCacheBuilder {
  public:
    CidCacheBuilder(db::CidCacheWriter& writer, StorageClientFactory make_client)
        : writer_{writer}, make_client_{std::move(make_client)} {}

    //! \throws std::invalid_argument on bad settings
    //! \throws db::PersistenceError on batch commit failure, batches committed before are kept
    CidCacheBuildResult build(const CidCacheBuildSettings& settings);

  private:
    db::CidCacheWriter& writer_;
    StorageClientFactory make_client_;
};

}  // namespace rubicid::builder
