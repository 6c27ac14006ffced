// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>

namespace rubicid {

class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    //! \brief Returns whether this Directory exists on filesystem
    bool exists() const;

    //! \brief Returns whether this Directory is empty
    bool is_empty() const;

    //! \brief Returns the std::filesystem::path of this Directory instance
    const std::filesystem::path& path() const { return path_; }

    //! \brief Removes all contained files and subdirectories
    virtual void clear() const;

    //! \brief Creates the directory on filesystem should not exist
    void create();

  protected:
    std::filesystem::path path_;
};

class TemporaryDirectory final : public Directory {
  public:
    //! \brief Creates an instance of a TemporaryDirectory below the OS temporary path
    explicit TemporaryDirectory() : Directory(TemporaryDirectory::get_unique_temporary_path(), true) {}

    ~TemporaryDirectory() final {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    //! \brief Builds a non-existent temporary path below the provided base path
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);
    static std::filesystem::path get_unique_temporary_path();
};

//! \brief The storage tree holding both token index databases
//! <datadir>
//! ├───hashindex
//! ├───cidcache
//! └───logs
class DataDirectory final : public Directory {
  public:
    explicit DataDirectory(const std::filesystem::path& base_path, bool create = false)
        : Directory(base_path, create),
          hash_index_(base_path / "hashindex", create),
          cid_cache_(base_path / "cidcache", create),
          logs_(base_path / "logs", create) {}

    //! \brief Creates an instance starting from default storage path
    explicit DataDirectory(bool create = false)
        : DataDirectory(DataDirectory::get_default_storage_path(), create) {}

    ~DataDirectory() final = default;

    DataDirectory(const DataDirectory&) = delete;
    DataDirectory& operator=(const DataDirectory&) = delete;

    //! \brief Returns the path for default storage as defined by XDG_DATA_HOME or HOME
    static std::filesystem::path get_default_storage_path();

    //! \brief Deploys the full tree on filesystem (i.e. missing directories are created)
    void deploy();

    void clear() const final { throw std::runtime_error("Can't clear a DataDirectory"); }

    //! \brief Returns the directory holding the hash => token MDBX environment
    const Directory& hash_index() const { return hash_index_; }
    //! \brief Returns the directory holding the cid => token MDBX environment
    const Directory& cid_cache() const { return cid_cache_; }
    const Directory& logs() const { return logs_; }

  private:
    Directory hash_index_;
    Directory cid_cache_;
    Directory logs_;
};

}  // namespace rubicid
