// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash_index.hpp"

#include <boost/endian/conversion.hpp>

#include <rubicid/db/errors.hpp>
#include <rubicid/db/tables.hpp>
#include <rubicid/infra/common/log.hpp>

namespace rubicid::db {

static constexpr size_t kHashIndexValueSize{1 + sizeof(TokenNumber)};

Bytes encode_hash_index_value(const TokenKey& key) {
    Bytes value(kHashIndexValueSize, 0);
    value[0] = key.level;
    boost::endian::store_big_u32(&value[1], key.number);
    return value;
}

std::optional<TokenKey> decode_hash_index_value(ByteView value) {
    if (value.size() != kHashIndexValueSize) {
        return std::nullopt;
    }
    return TokenKey{.level = value[0], .number = boost::endian::load_big_u32(&value[1])};
}

static ::mdbx::slice watermark_key() {
    return ::mdbx::slice{table::kHashIndexWatermark};
}

std::optional<TokenKey> HashIndex::lookup(const TokenHash& hash) {
    try {
        ROTxn txn{env_};
        if (!has_map(*txn, table::kHashIndex.name)) {
            return std::nullopt;
        }
        auto cursor{open_cursor(*txn, table::kHashIndex)};
        const auto result{cursor.find(to_slice({hash.data(), hash.size()}), /*throw_notfound=*/false)};
        if (!result) {
            return std::nullopt;
        }
        const auto key{decode_hash_index_value(from_slice(result.value))};
        if (!key) {
            RCID_WARN << "HashIndex: unexpected value size " << result.value.length();
        }
        return key;
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"HashIndex lookup failed: "} + ex.what()};
    }
}

void HashIndex::put_batch(const std::vector<HashIndexEntry>& entries, TokenNumber watermark) {
    try {
        RWTxn txn{env_};
        auto index_cursor{open_cursor(*txn, table::kHashIndex)};
        for (const auto& entry : entries) {
            const auto value{encode_hash_index_value(entry.key)};
            index_cursor.upsert(to_slice({entry.hash.data(), entry.hash.size()}), to_slice(value));
        }
        auto progress_cursor{open_cursor(*txn, table::kBuildProgress)};
        uint8_t watermark_value[sizeof(TokenNumber)];
        boost::endian::store_big_u32(watermark_value, watermark);
        progress_cursor.upsert(watermark_key(), to_slice({watermark_value, sizeof(watermark_value)}));
        txn.commit(/*renew=*/false);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"HashIndex batch commit failed: "} + ex.what()};
    }
}

TokenNumber HashIndex::watermark() {
    try {
        ROTxn txn{env_};
        if (!has_map(*txn, table::kBuildProgress.name)) {
            return 0;
        }
        auto cursor{open_cursor(*txn, table::kBuildProgress)};
        const auto result{cursor.find(watermark_key(), /*throw_notfound=*/false)};
        if (!result || result.value.length() != sizeof(TokenNumber)) {
            return 0;
        }
        return boost::endian::load_big_u32(static_cast<const uint8_t*>(result.value.data()));
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"HashIndex watermark read failed: "} + ex.what()};
    }
}

size_t HashIndex::size() {
    try {
        ROTxn txn{env_};
        return map_size(*txn, table::kHashIndex);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"HashIndex size read failed: "} + ex.what()};
    }
}

void HashIndex::clear() {
    try {
        RWTxn txn{env_};
        txn->clear_map(open_map(*txn, table::kHashIndex));
        auto progress_cursor{open_cursor(*txn, table::kBuildProgress)};
        if (progress_cursor.seek(watermark_key())) {
            progress_cursor.erase();
        }
        txn.commit(/*renew=*/false);
    } catch (const ::mdbx::exception& ex) {
        throw PersistenceError{std::string{"HashIndex clear failed: "} + ex.what()};
    }
}

}  // namespace rubicid::db
