// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace rubicid::ipfs {

using namespace std::chrono_literals;

//! \brief Everything needed to address the storage network through one node
//! \details Passed explicitly to each client so that concurrent workflows on different nodes never share routing state
struct NodeContext {
    std::string node_name;
    std::filesystem::path ipfs_path;  // repository of the node, exported as IPFS_PATH to each command
    std::string ipfs_binary{"ipfs"};
    std::chrono::milliseconds add_timeout{10s};
    std::chrono::milliseconds fetch_timeout{30s};
    std::chrono::milliseconds pin_timeout{30s};
};

}  // namespace rubicid::ipfs
