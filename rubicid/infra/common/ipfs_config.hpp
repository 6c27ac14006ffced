// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace rubicid {

inline constexpr const char* kIpfsPathKey{"IPFS_PATH"};
inline constexpr const char* kDefaultIpfsConfigFile{"ipfs_config.txt"};

//! Where to look for the storage network repository path of one node
struct IpfsConfigSettings {
    std::optional<std::filesystem::path> ipfs_path;  // explicit value, highest precedence
    std::filesystem::path config_file{kDefaultIpfsConfigFile};
    std::string ipfs_binary{"ipfs"};
};

//! \brief Extract the IPFS_PATH value from a key=value config stream
//! \details Blank lines and lines starting with '#' are ignored, surrounding quotes are removed from the value
std::optional<std::string> parse_ipfs_config(std::istream& input);

//! \brief Resolve the repository path: explicit value, then environment value, then config file
//! \details Candidates pointing to a non-existent path are skipped
//! \throws std::runtime_error if no candidate resolves to an existing path
std::filesystem::path resolve_ipfs_path(const IpfsConfigSettings& settings, const std::optional<std::string>& env_value);

//! \brief Same as above taking the environment value from the current process
std::filesystem::path resolve_ipfs_path(const IpfsConfigSettings& settings);

}  // namespace rubicid
