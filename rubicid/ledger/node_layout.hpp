// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rubicid::ledger {

//! \brief Files of one node below the wallets directory: wallets/nodeNNN/nodeNNN/{.ipfs,Rubix/rubix.db}
struct NodeLayout {
    std::string name;
    std::filesystem::path root;
    std::filesystem::path ipfs_path;
    std::filesystem::path ledger_path;
};

//! \brief Whether the name is "node" followed by one or more decimal digits
bool is_node_name(std::string_view name);

//! \brief Layout of the named node if its repository and ledger both exist
std::optional<NodeLayout> find_node(const std::filesystem::path& wallets_path, const std::string& name);

//! \brief All complete nodes below the wallets directory sorted by name, empty if the directory does not exist
std::vector<NodeLayout> discover_nodes(const std::filesystem::path& wallets_path);

}  // namespace rubicid::ledger
