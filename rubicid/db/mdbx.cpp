// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <stdexcept>

#include <rubicid/core/common/util.hpp>

namespace rubicid::db {

::mdbx::env_managed open_env(const EnvConfig& config) {
    namespace fs = std::filesystem;

    if (config.path.empty()) {
        throw std::invalid_argument("Invalid argument : config.path");
    }

    fs::path db_path{config.path};
    if (db_path.has_filename()) {
        db_path += fs::path::preferred_separator;  // Remove ambiguity. It has to be a directory
    }
    if (!fs::exists(db_path)) {
        if (!config.create) {
            throw std::runtime_error("Unable to locate " + db_path.string() + ", which is required to exist");
        }
        fs::create_directories(db_path);
    } else if (!fs::is_directory(db_path)) {
        throw std::runtime_error("Path " + db_path.string() + " is not valid");
    }

    const fs::path db_file{get_datafile_path(db_path)};
    const size_t db_ondisk_file_size{fs::exists(db_file) ? fs::file_size(db_file) : 0};
    if (!config.create && !db_ondisk_file_size) {
        throw std::runtime_error("Unable to locate " + db_file.string() + ", which is required to exist");
    }

    // Prevent mapping a file with a smaller map size than the size on disk.
    if (db_ondisk_file_size > config.max_size) {
        throw std::runtime_error("Database map size is too small. Min required " + human_size(db_ondisk_file_size));
    }

    if (config.exclusive && config.shared) {
        throw std::runtime_error("Exclusive conflicts with Shared");
    }
    if (config.create && config.readonly) {
        throw std::runtime_error("Create conflicts with Readonly");
    }

    uint32_t flags{MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE};  // Default flags
    if (config.readonly) {
        flags |= MDBX_RDONLY;
    }
    if (config.inmemory) {
        flags |= MDBX_NOMETASYNC;
    }
    if (config.exclusive) {
        flags |= MDBX_EXCLUSIVE;
    }
    if (config.shared) {
        flags |= MDBX_ACCEDE;
    }

    ::mdbx::env_managed::create_parameters cp{};  // Default create parameters
    if (!config.shared) {
        const auto max_map_size = static_cast<intptr_t>(config.inmemory ? 128_Mebi : config.max_size);
        const auto growth_size = static_cast<intptr_t>(config.inmemory ? 2_Mebi : config.growth_size);
        cp.geometry.make_dynamic(::mdbx::env::geometry::default_value, max_map_size);
        cp.geometry.growth_step = growth_size;
        cp.geometry.pagesize = 4_Kibi;
    }

    ::mdbx::env::operate_parameters op{};  // Operational parameters
    op.mode = op.mode_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.options = op.options_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.durability = op.durability_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.max_maps = config.max_tables;
    op.max_readers = config.max_readers;

    ::mdbx::env_managed ret{db_path.native(), cp, op, config.shared};
    if (!config.inmemory) {
        ret.check_readers();
    }
    return ret;
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    if (tx.is_readonly()) {
        return tx.open_map(config.name, config.key_mode, config.value_mode);
    }
    return tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    try {
        ::mdbx::map_handle main_map{1};
        auto main_crs{tx.open_cursor(main_map)};
        return main_crs.seek(::mdbx::slice(map_name));
    } catch (const ::mdbx::exception&) {
        return false;
    }
}

size_t map_size(::mdbx::txn& tx, const MapConfig& config) {
    if (!has_map(tx, config.name)) {
        return 0;
    }
    const auto map{open_map(tx, config)};
    return tx.get_map_stat(map).ms_entries;
}

size_t cursor_for_each(::mdbx::cursor& cursor, const WalkFunc& walker) {
    size_t ret{0};
    auto data{cursor.to_first(/*throw_notfound=*/false)};
    while (data.done) {
        ++ret;
        if (!walker(from_slice(data.key), from_slice(data.value))) {
            break;  // Walker function has returned false hence stop
        }
        data = cursor.to_next(/*throw_notfound=*/false);
    }
    return ret;
}

}  // namespace rubicid::db
