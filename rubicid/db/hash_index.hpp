// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <rubicid/core/types/token.hpp>
#include <rubicid/db/mdbx.hpp>

namespace rubicid::db {

//! \brief Point lookup from token hash back to the token it was derived from
class HashLookup {
  public:
    virtual ~HashLookup() = default;

    virtual std::optional<TokenKey> lookup(const TokenHash& hash) = 0;
};

struct HashIndexEntry {
    TokenHash hash{};
    TokenKey key;
};

//! \brief Persistent reverse map from token hash to token key stored in MDBX
//! \details Reads open a short-lived read transaction per call so instances can be shared among threads.
//! Writes must be issued by a single writer.
class HashIndex : public HashLookup {
  public:
    explicit HashIndex(::mdbx::env env) : env_{std::move(env)} {}

    std::optional<TokenKey> lookup(const TokenHash& hash) override;

    //! \brief Store the entries and the new build watermark atomically in one write transaction
    //! \throws PersistenceError on commit failure
    void put_batch(const std::vector<HashIndexEntry>& entries, TokenNumber watermark);

    //! \brief Highest token number whose batch has been committed, zero when nothing has been built yet
    TokenNumber watermark();

    //! \brief Number of stored entries
    size_t size();

    //! \brief Remove all entries and reset the watermark
    void clear();

  private:
    ::mdbx::env env_;
};

//! \brief Encode the stored value of a hash index entry
Bytes encode_hash_index_value(const TokenKey& key);

//! \brief Decode the stored value of a hash index entry, std::nullopt on unexpected layout
std::optional<TokenKey> decode_hash_index_value(ByteView value);

}  // namespace rubicid::db
