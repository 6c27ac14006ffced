// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <rubicid/core/types/token.hpp>
#include <rubicid/db/mdbx.hpp>

namespace rubicid::db {

//! \brief One precomputed token: its storage network identifier and canonical content
struct CidCacheEntry {
    std::string cid;
    std::string content;
    TokenKey key;

    friend bool operator==(const CidCacheEntry&, const CidCacheEntry&) = default;
};

//! \brief Closed interval of token numbers within one level
struct TokenRange {
    TokenLevel level{0};
    TokenNumber start{0};
    TokenNumber end{0};

    size_t count() const noexcept { return end >= start ? end - start + 1 : 0; }

    friend bool operator==(const TokenRange&, const TokenRange&) = default;
};

std::ostream& operator<<(std::ostream& out, const TokenRange& range);

struct CompletedRange {
    TokenRange range;
    int64_t completed_at{0};  // seconds since epoch
};

//! \brief Encode the stored value of a cache entry (the cid is the key)
Bytes encode_cid_cache_value(const CidCacheEntry& entry);

//! \brief Decode the stored value of a cache entry, std::nullopt on unexpected layout
std::optional<CidCacheEntry> decode_cid_cache_value(std::string_view cid, ByteView value);

//! \brief Read access to cached entries by cid
class CidCacheSource {
  public:
    virtual ~CidCacheSource() = default;

    virtual std::optional<CidCacheEntry> get(std::string_view cid) = 0;

    //! \brief Resolve many cids at once, missing cids are omitted from the result
    virtual std::vector<CidCacheEntry> get_many(const std::vector<std::string>& cids) = 0;

    //! \brief Trivial connectivity check
    virtual bool ping() = 0;
};

//! \brief Read handle on the cid cache owned by exactly one worker
//! \details The handle keeps one read transaction parked between queries and renews it on each query so that no
//! transaction is held open across queries. Must not be used concurrently.
class CidCacheReader : public CidCacheSource {
  public:
    explicit CidCacheReader(::mdbx::env env) : env_{std::move(env)} {}
    ~CidCacheReader() override;

    CidCacheReader(const CidCacheReader&) = delete;
    CidCacheReader& operator=(const CidCacheReader&) = delete;

    //! \throws PersistenceError on query failure
    std::optional<CidCacheEntry> get(std::string_view cid) override;

    //! \brief Resolve many cids in one read transaction, missing cids are omitted from the result
    //! \throws PersistenceError on query failure
    std::vector<CidCacheEntry> get_many(const std::vector<std::string>& cids) override;

    //! \brief Trivial connectivity check: a read transaction can be started
    bool ping() override;

  private:
    template <typename Query>
    auto read(Query&& query);

    void discard_transaction() noexcept;

    ::mdbx::env env_;
    ::mdbx::txn_managed txn_;
    std::optional<::mdbx::map_handle> map_;
};

//! \brief Write handle on the cid cache, only one writer at a time
class CidCacheWriter {
  public:
    struct CommitResult {
        size_t inserted{0};
        size_t already_present{0};
    };

    explicit CidCacheWriter(::mdbx::env env) : env_{std::move(env)} {}

    //! \brief Insert-if-absent all entries in one write transaction
    //! \throws PersistenceError on commit failure, in which case nothing of the batch is stored
    CommitResult commit_batch(const std::vector<CidCacheEntry>& entries);

    //! \brief Mark the given range as completely processed
    //! \throws PersistenceError on commit failure
    void record_range(const TokenRange& range, int64_t completed_at);

    std::vector<CompletedRange> completed_ranges();

    //! \brief Number of cached entries
    size_t size();

  private:
    ::mdbx::env env_;
};

}  // namespace rubicid::db
