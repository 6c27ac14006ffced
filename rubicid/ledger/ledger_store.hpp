// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace rubicid::ledger {

using TokenStatus = int;

//! Token reported by the node and not validated yet
inline constexpr TokenStatus kPendingStatus{0};

//! Token permanently rejected, no transition ever leaves this state
inline constexpr TokenStatus kRejectedStatus{2302};

struct LedgerTokenRecord {
    std::string token_id;  // identifier exactly as stored by the ledger
    std::string cid;       // token_id without surrounding whitespace
};

//! \brief Failure while reading or updating the ledger of one node
class LedgerError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief Token records of one node ledger
class LedgerStore {
  public:
    virtual ~LedgerStore() = default;

    //! \brief All tokens whose status is \ref kPendingStatus
    //! \throws LedgerError
    virtual std::vector<LedgerTokenRecord> pending_tokens() = 0;

    //! \brief Set the status of the given token if it is still pending
    //! \return true if a record has been updated, false if the token is unknown or no longer pending
    //! \throws LedgerError
    virtual bool update_status(const LedgerTokenRecord& token, TokenStatus status) = 0;
};

}  // namespace rubicid::ledger
