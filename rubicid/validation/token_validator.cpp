// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "token_validator.hpp"

#include <sstream>
#include <utility>

#include <magic_enum.hpp>

#include <rubicid/core/common/util.hpp>
#include <rubicid/core/types/token.hpp>
#include <rubicid/db/errors.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::validation {

bool is_rejection(TokenVerdict verdict) noexcept {
    switch (verdict) {
        case TokenVerdict::kFetchFailed:
        case TokenVerdict::kDecodeFailed:
        case TokenVerdict::kLookupMiss:
        case TokenVerdict::kRangeViolation:
        case TokenVerdict::kCidMismatch:
            return true;
        default:
            return false;
    }
}

std::ostream& operator<<(std::ostream& out, TokenVerdict verdict) {
    out << magic_enum::enum_name(verdict);
    return out;
}

NodeStats& NodeStats::operator+=(const NodeStats& other) {
    processed += other.processed;
    pinned += other.pinned;
    invalid += other.invalid;
    errors += other.errors;
    return *this;
}

std::ostream& operator<<(std::ostream& out, const NodeStats& stats) {
    out << "processed: " << stats.processed << " pinned: " << stats.pinned << " invalid: " << stats.invalid
        << " errors: " << stats.errors;
    return out;
}

TokenValidator::TokenValidator(std::string node_name,
                               ipfs::StorageClient& storage,
                               ledger::LedgerStore& ledger,
                               db::HashLookup& hash_index,
                               ValidatorSettings settings)
    : node_name_{std::move(node_name)},
      storage_{storage},
      ledger_{ledger},
      hash_index_{hash_index},
      settings_{settings} {}

NodeStats TokenValidator::process() {
    NodeStats stats;
    const auto pending_tokens{ledger_.pending_tokens()};
    log::Info("Validating pending tokens", {"node", node_name_,
                                            "pending", std::to_string(pending_tokens.size()),
                                            "dry_run", settings_.dry_run ? "true" : "false"});
    for (const auto& token : pending_tokens) {
        // A failing token stays pending for the next run, the remaining ones are still processed
        try {
            process_token(token, stats);
        } catch (const db::PersistenceError& ex) {
            ++stats.errors;
            log::Error("Hash index unavailable for token", {"node", node_name_, "cid", token.cid, "error", ex.what()});
        } catch (const std::exception& ex) {
            ++stats.errors;
            log::Error("Unexpected token failure", {"node", node_name_, "cid", token.cid, "error", ex.what()});
        }
    }
    log::Info("Node validated", {"node", node_name_,
                                 "processed", std::to_string(stats.processed),
                                 "pinned", std::to_string(stats.pinned),
                                 "invalid", std::to_string(stats.invalid),
                                 "errors", std::to_string(stats.errors)});
    return stats;
}

TokenVerdict TokenValidator::process_token(const ledger::LedgerTokenRecord& token, NodeStats& stats) {
    ++stats.processed;
    auto verdict{check(token)};
    if (is_rejection(verdict)) {
        reject(token, verdict, stats);
    } else if (verdict == TokenVerdict::kAdmitted) {
        admit(token, stats, verdict);
    } else {
        ++stats.errors;
    }
    return verdict;
}

TokenVerdict TokenValidator::check(const ledger::LedgerTokenRecord& token) {
    std::string fetched;
    try {
        fetched = storage_.fetch(token.cid);
    } catch (const ipfs::FetchError& ex) {
        log::Warning("Cannot fetch token content", {"node", node_name_, "cid", token.cid, "error", ex.what()});
        return TokenVerdict::kFetchFailed;
    }

    const auto content_view{trim(fetched)};
    const auto content{decode_token_content(content_view)};
    if (!content) {
        log::Warning("Invalid token content", {"node", node_name_,
                                               "cid", token.cid,
                                               "content", abridge(content_view, kTokenContentLength),
                                               "error", std::string{magic_enum::enum_name(content.error())}});
        return TokenVerdict::kDecodeFailed;
    }

    const auto indexed_key{hash_index_.lookup(content->hash)};
    if (!indexed_key) {
        log::Warning("Token hash not found", {"node", node_name_, "cid", token.cid, "content", std::string{content_view}});
        return TokenVerdict::kLookupMiss;
    }

    const TokenKey key{content->level, indexed_key->number};
    if (!key.is_valid()) {
        std::ostringstream key_stream;
        key_stream << key;
        log::Warning("Token number out of level range", {"node", node_name_, "cid", token.cid, "token", key_stream.str()});
        return TokenVerdict::kRangeViolation;
    }

    // Content published with a non-canonical encoding must still resolve to the same identifier once normalized
    const auto canonical_content{content->to_string()};
    if (content_view != canonical_content) {
        std::string canonical_cid;
        try {
            canonical_cid = storage_.add(canonical_content, {.only_hash = settings_.dry_run, .pin = false});
        } catch (const ipfs::AddError& ex) {
            log::Error("Cannot add canonical token content", {"node", node_name_, "cid", token.cid, "error", ex.what()});
            return TokenVerdict::kAddFailed;
        }
        if (canonical_cid != token.cid) {
            log::Warning("Token cid differs from canonical content cid",
                         {"node", node_name_, "cid", token.cid, "canonical_cid", canonical_cid});
            return TokenVerdict::kCidMismatch;
        }
    }

    return TokenVerdict::kAdmitted;
}

void TokenValidator::reject(const ledger::LedgerTokenRecord& token, TokenVerdict verdict, NodeStats& stats) {
    ++stats.invalid;
    if (verdict == TokenVerdict::kCidMismatch) {
        ++stats.errors;
    }
    if (settings_.dry_run) {
        log::Info("[dry-run] Token would be rejected", {"node", node_name_, "cid", token.cid, "verdict",
                                                        std::string{magic_enum::enum_name(verdict)}});
        return;
    }
    try {
        if (!ledger_.update_status(token, ledger::kRejectedStatus)) {
            log::Warning("Rejected token no longer pending in ledger", {"node", node_name_, "token_id", token.token_id});
        }
    } catch (const ledger::LedgerError& ex) {
        ++stats.errors;
        log::Error("Cannot reject token", {"node", node_name_, "cid", token.cid, "error", ex.what()});
    }
}

void TokenValidator::admit(const ledger::LedgerTokenRecord& token, NodeStats& stats, TokenVerdict& verdict) {
    if (settings_.dry_run) {
        ++stats.pinned;
        log::Info("[dry-run] Token would be pinned", {"node", node_name_, "cid", token.cid});
        return;
    }
    try {
        storage_.ensure_pinned(token.cid);
    } catch (const ipfs::PinError& ex) {
        ++stats.errors;
        verdict = TokenVerdict::kPinFailed;
        log::Error("Cannot pin token", {"node", node_name_, "cid", token.cid, "error", ex.what()});
        return;
    }
    ++stats.pinned;
    log::Debug("Token pinned", {"node", node_name_, "cid", token.cid});

    if (!settings_.admitted_status) return;
    try {
        if (!ledger_.update_status(token, *settings_.admitted_status)) {
            log::Warning("Admitted token no longer pending in ledger", {"node", node_name_, "token_id", token.token_id});
        }
    } catch (const ledger::LedgerError& ex) {
        ++stats.errors;
        log::Error("Cannot admit token", {"node", node_name_, "cid", token.cid, "error", ex.what()});
    }
}

}  // namespace rubicid::validation
