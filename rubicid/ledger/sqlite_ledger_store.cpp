// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sqlite_ledger_store.hpp"

#include <string>

#include <gsl/narrow>
#include <sqlite3.h>

#include <rubicid/core/common/util.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::ledger {

namespace {

    //! Prepared statement finalized on scope exit
    struct Statement {
        sqlite3_stmt* handle{nullptr};
        ~Statement() {
            if (handle) sqlite3_finalize(handle);
        }
    };

    void check_sqlite(int rc, sqlite3* db, const char* what) {
        if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
            throw LedgerError{std::string{what} + " failed: " + sqlite3_errmsg(db) + " (rc=" + std::to_string(rc) + ")"};
        }
    }

}  // namespace

SqliteLedgerStore::SqliteLedgerStore(const std::filesystem::path& db_path, std::chrono::milliseconds busy_timeout) {
    const int rc{sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX, nullptr)};
    if (rc != SQLITE_OK) {
        const std::string reason{db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)};
        sqlite3_close(db_);
        db_ = nullptr;
        throw LedgerError{"cannot open ledger " + db_path.string() + ": " + reason};
    }
    sqlite3_busy_timeout(db_, gsl::narrow<int>(busy_timeout.count()));
}

SqliteLedgerStore::~SqliteLedgerStore() {
    if (db_) {
        const int rc{sqlite3_close(db_)};
        if (rc != SQLITE_OK) {
            RCID_ERROR << "SqliteLedgerStore: close failed: " << sqlite3_errstr(rc);
        }
    }
}

std::vector<LedgerTokenRecord> SqliteLedgerStore::pending_tokens() {
    Statement stmt;
    check_sqlite(sqlite3_prepare_v2(db_, "SELECT token_id FROM TokensTable WHERE token_status = ?;", -1,
                                    &stmt.handle, nullptr),
                 db_, "pending tokens prepare");
    check_sqlite(sqlite3_bind_int(stmt.handle, 1, kPendingStatus), db_, "pending tokens bind");

    std::vector<LedgerTokenRecord> tokens;
    int rc{SQLITE_ROW};
    while ((rc = sqlite3_step(stmt.handle)) == SQLITE_ROW) {
        const auto* text{reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle, 0))};
        if (!text) continue;
        std::string token_id{text, static_cast<size_t>(sqlite3_column_bytes(stmt.handle, 0))};
        std::string cid{trim(token_id)};
        tokens.push_back({.token_id = std::move(token_id), .cid = std::move(cid)});
    }
    check_sqlite(rc, db_, "pending tokens step");
    return tokens;
}

bool SqliteLedgerStore::update_status(const LedgerTokenRecord& token, TokenStatus status) {
    Statement stmt;
    check_sqlite(sqlite3_prepare_v2(db_,
                                    "UPDATE TokensTable SET token_status = ? WHERE token_id = ? AND token_status = ?;",
                                    -1, &stmt.handle, nullptr),
                 db_, "status update prepare");
    check_sqlite(sqlite3_bind_int(stmt.handle, 1, status), db_, "status update bind");
    check_sqlite(sqlite3_bind_text(stmt.handle, 2, token.token_id.c_str(), gsl::narrow<int>(token.token_id.size()),
                                   SQLITE_TRANSIENT),
                 db_, "status update bind");
    check_sqlite(sqlite3_bind_int(stmt.handle, 3, kPendingStatus), db_, "status update bind");
    check_sqlite(sqlite3_step(stmt.handle), db_, "status update step");
    return sqlite3_changes(db_) > 0;
}

}  // namespace rubicid::ledger
