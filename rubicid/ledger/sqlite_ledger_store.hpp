// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>

#include <rubicid/ledger/ledger_store.hpp>

struct sqlite3;

namespace rubicid::ledger {

using namespace std::chrono_literals;

//! \brief Ledger store backed by the SQLite database owned by the node software (TokensTable)
//! \details The database must already exist: it is never created. One instance per node and thread.
class SqliteLedgerStore : public LedgerStore {
  public:
    //! \throws LedgerError if the database cannot be opened
    explicit SqliteLedgerStore(const std::filesystem::path& db_path, std::chrono::milliseconds busy_timeout = 5s);
    ~SqliteLedgerStore() override;

    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    std::vector<LedgerTokenRecord> pending_tokens() override;
    bool update_status(const LedgerTokenRecord& token, TokenStatus status) override;

  private:
    sqlite3* db_{nullptr};
};

}  // namespace rubicid::ledger
