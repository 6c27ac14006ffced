// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cid_cache.hpp"

#include <boost/endian/conversion.hpp>

#include <rubicid/db/errors.hpp>
#include <rubicid/db/tables.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::db {

static constexpr size_t kCidCacheValueSize{1 + sizeof(TokenNumber) + kTokenContentLength};
static constexpr size_t kRangeKeySize{1 + 2 * sizeof(TokenNumber)};

std::ostream& operator<<(std::ostream& out, const TokenRange& range) {
    out << "level=" << static_cast<int>(range.level) << " [" << range.start << ", " << range.end << "]";
    return out;
}

Bytes encode_cid_cache_value(const CidCacheEntry& entry) {
    Bytes value(1 + sizeof(TokenNumber), 0);
    value[0] = entry.key.level;
    boost::endian::store_big_u32(&value[1], entry.key.number);
    value.append(string_view_to_byte_view(entry.content));
    return value;
}

std::optional<CidCacheEntry> decode_cid_cache_value(std::string_view cid, ByteView value) {
    if (value.size() != kCidCacheValueSize) {
        return std::nullopt;
    }
    return CidCacheEntry{
        .cid = std::string{cid},
        .content = std::string{byte_view_to_string_view(value.substr(1 + sizeof(TokenNumber)))},
        .key = {.level = value[0], .number = boost::endian::load_big_u32(&value[1])},
    };
}

static Bytes encode_range_key(const TokenRange& range) {
    Bytes key(kRangeKeySize, 0);
    key[0] = range.level;
    boost::endian::store_big_u32(&key[1], range.start);
    boost::endian::store_big_u32(&key[1 + sizeof(TokenNumber)], range.end);
    return key;
}

CidCacheReader::~CidCacheReader() {
    discard_transaction();
}

void CidCacheReader::discard_transaction() noexcept {
    if (!txn_) return;
    try {
        txn_.abort();
    } catch (const ::mdbx::exception& ex) {
        RCID_ERROR << "CidCacheReader: cannot abort parked transaction: " << ex.what();
    }
}

template <typename Query>
auto CidCacheReader::read(Query&& query) {
    try {
        if (!txn_) {
            txn_ = env_.start_read();
        } else {
            txn_.renew_reading();
        }
        if (!map_ && has_map(txn_, table::kCidCache.name)) {
            map_ = open_map(txn_, table::kCidCache);
        }
        auto result{query(txn_)};
        txn_.reset_reading();
        return result;
    } catch (const ::mdbx::exception& ex) {
        discard_transaction();
        throw PersistenceError{std::string{"CidCache query failed: "} + ex.what()};
    }
}

std::optional<CidCacheEntry> CidCacheReader::get(std::string_view cid) {
    return read([&](::mdbx::txn& txn) -> std::optional<CidCacheEntry> {
        if (!map_) return std::nullopt;
        const auto found{txn.get(*map_, ::mdbx::slice{cid.data(), cid.size()}, ::mdbx::slice::invalid())};
        if (!found.is_valid()) return std::nullopt;
        return decode_cid_cache_value(cid, from_slice(found));
    });
}

std::vector<CidCacheEntry> CidCacheReader::get_many(const std::vector<std::string>& cids) {
    return read([&](::mdbx::txn& txn) {
        std::vector<CidCacheEntry> entries;
        if (!map_) return entries;
        entries.reserve(cids.size());
        for (const auto& cid : cids) {
            const auto found{txn.get(*map_, ::mdbx::slice{cid.data(), cid.size()}, ::mdbx::slice::invalid())};
            if (!found.is_valid()) continue;
            if (auto entry{decode_cid_cache_value(cid, from_slice(found))}; entry) {
                entries.push_back(std::move(*entry));
            } else {
                RCID_WARN << "CidCache: unexpected value size " << found.length() << " for cid " << cid;
            }
        }
        return entries;
    });
}

bool CidCacheReader::ping() {
    return read([](::mdbx::txn& txn) { return txn.id() > 0; });
}

CidCacheWriter::CommitResult CidCacheWriter::commit_batch(const std::vector<CidCacheEntry>& entries) {
    CommitResult result;
    try {
        RWTxn txn{env_};
        auto cursor{open_cursor(*txn, table::kCidCache)};
        for (const auto& entry : entries) {
            const auto value{encode_cid_cache_value(entry)};
            const auto outcome{cursor.try_insert(::mdbx::slice{entry.cid.data(), entry.cid.size()}, to_slice(value))};
            if (outcome.done) {
                ++result.inserted;
            } else {
                ++result.already_present;
            }
        }
        txn.commit(/*renew=*/false);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"CidCache batch commit failed: "} + ex.what()};
    }
    return result;
}

void CidCacheWriter::record_range(const TokenRange& range, int64_t completed_at) {
    try {
        RWTxn txn{env_};
        auto cursor{open_cursor(*txn, table::kCidCacheRanges)};
        const auto key{encode_range_key(range)};
        uint8_t value[sizeof(uint64_t)];
        boost::endian::store_big_u64(value, static_cast<uint64_t>(completed_at));
        cursor.upsert(to_slice(key), to_slice({value, sizeof(value)}));
        txn.commit(/*renew=*/false);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"CidCache range record failed: "} + ex.what()};
    }
}

std::vector<CompletedRange> CidCacheWriter::completed_ranges() {
    try {
        std::vector<CompletedRange> ranges;
        ROTxn txn{env_};
        if (!has_map(*txn, table::kCidCacheRanges.name)) {
            return ranges;
        }
        auto cursor{open_cursor(*txn, table::kCidCacheRanges)};
        cursor_for_each(cursor, [&](ByteView key, ByteView value) {
            if (key.size() != kRangeKeySize || value.size() != sizeof(uint64_t)) {
                RCID_WARN << "CidCacheRanges: skipping record with unexpected layout";
                return true;
            }
            ranges.push_back({
                .range = {
                    .level = key[0],
                    .start = boost::endian::load_big_u32(&key[1]),
                    .end = boost::endian::load_big_u32(&key[1 + sizeof(TokenNumber)]),
                },
                .completed_at = static_cast<int64_t>(boost::endian::load_big_u64(value.data())),
            });
            return true;
        });
        return ranges;
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"CidCacheRanges read failed: "} + ex.what()};
    }
}

size_t CidCacheWriter::size() {
    try {
        ROTxn txn{env_};
        return map_size(*txn, table::kCidCache);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"CidCache size read failed: "} + ex.what()};
    }
}

}  // namespace rubicid::db
