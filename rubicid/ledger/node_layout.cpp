// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "node_layout.hpp"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

namespace rubicid::ledger {

namespace fs = std::filesystem;

static constexpr std::string_view kNodePrefix{"node"};

bool is_node_name(std::string_view name) {
    if (!absl::StartsWith(name, kNodePrefix) || name.size() == kNodePrefix.size()) {
        return false;
    }
    const auto digits{name.substr(kNodePrefix.size())};
    return std::all_of(digits.cbegin(), digits.cend(), [](char c) { return absl::ascii_isdigit(static_cast<unsigned char>(c)); });
}

std::optional<NodeLayout> find_node(const fs::path& wallets_path, const std::string& name) {
    const auto root{wallets_path / name};
    const auto inner{root / name};
    NodeLayout layout{
        .name = name,
        .root = root,
        .ipfs_path = inner / ".ipfs",
        .ledger_path = inner / "Rubix" / "rubix.db",
    };
    std::error_code ec;
    if (!fs::is_directory(root, ec) || !fs::exists(layout.ipfs_path, ec) || !fs::exists(layout.ledger_path, ec)) {
        return std::nullopt;
    }
    return layout;
}

std::vector<NodeLayout> discover_nodes(const fs::path& wallets_path) {
    std::vector<NodeLayout> nodes;
    std::error_code ec;
    if (!fs::is_directory(wallets_path, ec)) {
        return nodes;
    }
    for (const auto& item : fs::directory_iterator{wallets_path, ec}) {
        const auto name{item.path().filename().string()};
        if (!item.is_directory(ec) || !is_node_name(name)) continue;
        if (auto layout{find_node(wallets_path, name)}; layout) {
            nodes.push_back(std::move(*layout));
        }
    }
    std::sort(nodes.begin(), nodes.end(), [](const auto& lhs, const auto& rhs) { return lhs.name < rhs.name; });
    return nodes;
}

}  // namespace rubicid::ledger
