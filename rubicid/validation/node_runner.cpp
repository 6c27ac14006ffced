// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "node_runner.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/worker_pool.hpp>
#include <rubicid/ipfs/ipfs_cli_client.hpp>
#include <rubicid/ledger/sqlite_ledger_store.hpp>

namespace rubicid::validation {

NodeWorkflow make_node_workflow(db::HashLookup& hash_index, std::string ipfs_binary, ValidatorSettings settings) {
    return [&hash_index, ipfs_binary = std::move(ipfs_binary), settings](const ledger::NodeLayout& node) {
        ipfs::IpfsCliClient storage{ipfs::NodeContext{
            .node_name = node.name,
            .ipfs_path = node.ipfs_path,
            .ipfs_binary = ipfs_binary,
        }};
        ledger::SqliteLedgerStore ledger{node.ledger_path};
        TokenValidator validator{node.name, storage, ledger, hash_index, settings};
        return validator.process();
    };
}

static NodeReport run_node(const ledger::NodeLayout& node, const NodeWorkflow& workflow) {
    NodeReport report{.node_name = node.name};
    try {
        report.stats = workflow(node);
    } catch (const std::exception& ex) {
        report.error = ex.what();
        log::Error("Node validation failed", {"node", node.name, "error", report.error});
    }
    return report;
}

std::vector<NodeReport> run_nodes(const std::vector<ledger::NodeLayout>& nodes, const NodeWorkflow& workflow,
                                  size_t concurrency) {
    std::vector<NodeReport> reports(nodes.size());
    if (nodes.empty()) return reports;

    const size_t num_workers{std::clamp<size_t>(concurrency, 1, nodes.size())};
    if (num_workers == 1) {
        std::transform(nodes.cbegin(), nodes.cend(), reports.begin(),
                       [&](const auto& node) { return run_node(node, workflow); });
        return reports;
    }

    concurrency::WorkerPool workers{num_workers};
    for (size_t i{0}; i < nodes.size(); ++i) {
        boost::asio::post(workers, [&, i]() {
            reports[i] = run_node(nodes[i], workflow);
        });
    }
    workers.join();
    return reports;
}

NodeStats total_stats(const std::vector<NodeReport>& reports) {
    NodeStats total;
    for (const auto& report : reports) {
        if (report.stats) {
            total += *report.stats;
        }
    }
    return total;
}

}  // namespace rubicid::validation
