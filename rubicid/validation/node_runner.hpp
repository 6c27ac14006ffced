// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <rubicid/db/hash_index.hpp>
#include <rubicid/ledger/node_layout.hpp>
#include <rubicid/validation/token_validator.hpp>

namespace rubicid::validation {

//! Outcome of the validation workflow of one node
struct NodeReport {
    std::string node_name;
    std::optional<NodeStats> stats;  // empty when the workflow failed as a whole
    std::string error;
};

//! Validation workflow of one node, it must bind its own collaborators for its whole lifetime
using NodeWorkflow = std::function<NodeStats(const ledger::NodeLayout&)>;

//! \brief Workflow validating one node through its command line storage client and SQLite ledger
NodeWorkflow make_node_workflow(db::HashLookup& hash_index, std::string ipfs_binary, ValidatorSettings settings);

//! \brief Run the workflow on each node, at most \p concurrency nodes at a time
//! \details Reports are returned in node order. A failing node never prevents the others from running.
std::vector<NodeReport> run_nodes(const std::vector<ledger::NodeLayout>& nodes, const NodeWorkflow& workflow,
                                  size_t concurrency);

//! \brief Sum of the stats of all successful reports
NodeStats total_stats(const std::vector<NodeReport>& reports);

}  // namespace rubicid::validation
