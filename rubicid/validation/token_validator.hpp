// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include <rubicid/db/hash_index.hpp>
#include <rubicid/ipfs/storage_client.hpp>
#include <rubicid/ledger/ledger_store.hpp>

namespace rubicid::validation {

//! Outcome of the validation of one pending token
enum class TokenVerdict {
    kAdmitted,
    kFetchFailed,
    kDecodeFailed,
    kLookupMiss,
    kRangeViolation,
    kCidMismatch,
    kAddFailed,
    kPinFailed,
};

//! Whether the verdict moves the token to the rejected status
bool is_rejection(TokenVerdict verdict) noexcept;

std::ostream& operator<<(std::ostream& out, TokenVerdict verdict);

struct ValidatorSettings {
    //! Validate without pinning and without touching the ledger
    bool dry_run{false};

    //! Status assigned to tokens successfully pinned, status left unchanged when not set
    std::optional<ledger::TokenStatus> admitted_status;
};

//! Counters of one validation run over one node
struct NodeStats {
    size_t processed{0};
    size_t pinned{0};
    size_t invalid{0};
    size_t errors{0};

    NodeStats& operator+=(const NodeStats& other);
    friend bool operator==(const NodeStats&, const NodeStats&) = default;
};

std::ostream& operator<<(std::ostream& out, const NodeStats& stats);

//! \brief Validation workflow for the pending tokens of exactly one node
//! \details Every collaborator is bound to the node for the whole lifetime of the instance: the storage client carries
//! the node context, the ledger store its database. Errors on one token never stop the processing of the others.
class TokenValidator {
  public:
    TokenValidator(std::string node_name,
                   ipfs::StorageClient& storage,
                   ledger::LedgerStore& ledger,
                   db::HashLookup& hash_index,
                   ValidatorSettings settings);

    //! \brief Validate all pending tokens of the node
    //! \throws ledger::LedgerError if pending tokens cannot be listed
    NodeStats process();

    //! \brief Validate and apply the verdict to one token, updating the given counters
    TokenVerdict process_token(const ledger::LedgerTokenRecord& token, NodeStats& stats);

    //! \brief Check one token against the storage network and the hash index without any side effect on the ledger
    TokenVerdict check(const ledger::LedgerTokenRecord& token);

  private:
    void reject(const ledger::LedgerTokenRecord& token, TokenVerdict verdict, NodeStats& stats);
    void admit(const ledger::LedgerTokenRecord& token, NodeStats& stats, TokenVerdict& verdict);

    std::string node_name_;
    ipfs::StorageClient& storage_;
    ledger::LedgerStore& ledger_;
    db::HashLookup& hash_index_;
    ValidatorSettings settings_;
};

}  // namespace rubicid::validation
