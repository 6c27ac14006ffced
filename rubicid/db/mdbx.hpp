// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wshadow"
#include <mdbx.h++>
#pragma GCC diagnostic pop

#include <rubicid/core/common/base.hpp>
#include <rubicid/core/common/bytes.hpp>

namespace rubicid::db {

inline constexpr std::string_view kDbDataFileName{"mdbx.dat"};
inline constexpr std::string_view kDbLockFileName{"mdbx.lck"};

//! \brief This class wraps a read only transaction.
//! It is used to make clear in the methods signature that the method does not require read-write access.
class ROTxn {
  public:
    explicit ROTxn(mdbx::env& env) : managed_txn_{env.start_read()} {}
    ROTxn(ROTxn&& source) noexcept = default;

    mdbx::txn& operator*() { return managed_txn_; }
    mdbx::txn* operator->() { return &managed_txn_; }
    operator mdbx::txn&() { return managed_txn_; }

    void abort() { managed_txn_.abort(); }

  protected:
    explicit ROTxn(mdbx::txn_managed&& source) : managed_txn_{std::move(source)} {}

    mdbx::txn_managed managed_txn_;
};

//! \brief This class wraps read-write transactions
class RWTxn : public ROTxn {
  public:
    explicit RWTxn(mdbx::env& env) : ROTxn{env.start_write()} {}

    RWTxn(const RWTxn&) = delete;
    RWTxn& operator=(const RWTxn&) = delete;
    RWTxn(RWTxn&& source) noexcept = default;

    //! \brief Commit and optionally start a new write transaction on the same environment
    //! \remarks Pass renew == false on the last commit before the environment gets closed
    void commit(bool renew = true) {
        mdbx::env env = managed_txn_.env();
        managed_txn_.commit();
        if (renew) {
            managed_txn_ = env.start_write();
        }
    }
};

//! \brief Essential environment settings
struct EnvConfig {
    std::string path{};
    bool create{false};           // Whether db file must be created
    bool readonly{false};         // Whether db should be opened in RO mode
    bool exclusive{false};        // Whether this process has exclusive access
    bool inmemory{false};         // Whether this db is in memory
    bool shared{false};           // Whether this process opens a db already opened by another process
    size_t max_size{1_Tebi};      // Mdbx max map size
    size_t growth_size{1_Gibi};   // Increment size for each extension
    uint32_t max_tables{16};      // Default max number of named tables
    uint32_t max_readers{256};    // Default max number of readers
};

//! \brief Configuration settings for a "map" (aka a table)
struct MapConfig {
    const char* name{nullptr};                                        // Name of the table (is key in MAIN_DBI)
    const ::mdbx::key_mode key_mode{::mdbx::key_mode::usual};         // Key collation order
    const ::mdbx::value_mode value_mode{::mdbx::value_mode::single};  // Data Storage Mode
};

//! \brief Opens an mdbx environment using the provided environment config
//! \remarks When create is set the data file is created if missing, otherwise it must exist
::mdbx::env_managed open_env(const EnvConfig& config);

//! \brief Opens an mdbx "map" (aka table), creating it when the transaction is read-write
::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config);

//! \brief Opens a cursor to an mdbx "map" (aka table)
::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config);

//! \brief Checks whether a provided map name exists in database
bool has_map(::mdbx::txn& tx, const char* map_name);

//! \brief Number of records in the named map, zero if the map does not exist
size_t map_size(::mdbx::txn& tx, const MapConfig& config);

//! \brief Builds the full path to mdbx datafile provided a directory
inline std::filesystem::path get_datafile_path(const std::filesystem::path& base_path) noexcept {
    return base_path / std::filesystem::path(kDbDataFileName);
}

//! \brief Reference to a processing function invoked by cursor_for_each on each record.
//! Returning false stops the loop
using WalkFunc = std::function<bool(ByteView key, ByteView value)>;

//! \brief Executes a function on each record from the beginning of the table
//! \return The overall number of processed records
size_t cursor_for_each(::mdbx::cursor& cursor, const WalkFunc& walker);

inline mdbx::slice to_slice(ByteView value) { return {value.data(), value.length()}; }

inline ByteView from_slice(const mdbx::slice slice) {
    return {static_cast<const uint8_t*>(slice.data()), slice.length()};
}

}  // namespace rubicid::db
