// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <rubicid/core/types/token.hpp>
#include <rubicid/db/hash_index.hpp>
#include <rubicid/infra/concurrency/worker_pool.hpp>

namespace rubicid::builder {

struct HashIndexBuildSettings {
    std::vector<TokenLevel> levels{1, 2, 3, 4};
    std::optional<TokenNumber> last_number;  // stop at this number instead of the highest one of the levels
    size_t batch_size{100'000};
    size_t num_workers{concurrency::kDefaultNumWorkers};
    bool force{false};
};

struct HashIndexBuildResult {
    TokenNumber first_number{0};  // first number hashed by this run, zero when nothing was left to do
    TokenNumber watermark{0};     // highest number committed after this run
    size_t written{0};
    bool completed{false};  // false when interrupted before reaching the highest requested number
};

struct HashIndexVerifySettings {
    std::vector<TokenLevel> levels{1, 2, 3, 4};
    std::optional<TokenNumber> last_number;
    bool full{false};
    size_t sample_size{1'000};
    std::optional<uint64_t> seed;
};

struct HashIndexVerifyReport {
    size_t checked{0};
    size_t missing{0};
    size_t mismatched{0};
    size_t entries{0};
    size_t expected_entries{0};

    bool ok() const noexcept { return missing == 0 && mismatched == 0 && entries == expected_entries; }
};

//! Reference token always included in sampled verification
inline constexpr TokenNumber kReferenceTokenNumber{1'662'242};

//! \brief Highest token number among the given levels
//! \throws std::invalid_argument if the list is empty or holds an unknown level
TokenNumber max_number_for_levels(const std::vector<TokenLevel>& levels);

//! \brief Builds the HashIndex for the whole token universe of the requested levels
//! \details Each number is hashed once and stored under the highest level containing it. Hashing runs in parallel
//! on a worker pool, batches are committed in number order by the calling thread together with the watermark, so
//! an interrupted build resumes from the last committed batch.
class HashIndexBuilder {
  public:
    explicit HashIndexBuilder(db::HashIndex& index) : index_{index} {}

    //! \throws std::invalid_argument on bad settings
    //! \throws db::PersistenceError on commit failure
    HashIndexBuildResult build(const HashIndexBuildSettings& settings);

    //! \brief Re-derive entries and compare them with the stored ones, never mutates the index
    HashIndexVerifyReport verify(const HashIndexVerifySettings& settings);

  private:
    bool check_entry(TokenNumber number, HashIndexVerifyReport& report);

    db::HashIndex& index_;
};

//! \brief Highest number covered by a build or a verification: the optional bound clamped to the levels
//! \throws std::invalid_argument if the bound is zero
TokenNumber effective_last_number(const std::vector<TokenLevel>& levels, std::optional<TokenNumber> last_number);

//! \brief Entries for the numbers in [first, last]
std::vector<db::HashIndexEntry> derive_hash_index_entries(TokenNumber first, TokenNumber last);

}  // namespace rubicid::builder
