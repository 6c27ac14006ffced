// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/process/environment.hpp>

#include <rubicid/db/hash_index.hpp>
#include <rubicid/db/mdbx.hpp>
#include <rubicid/infra/cli/common.hpp>
#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/ledger/node_layout.hpp>
#include <rubicid/validation/node_runner.hpp>

using namespace rubicid;
using namespace rubicid::cmd::common;

//! The overall settings for the token validator
struct ValidatorToolSettings {
    log::Settings log_settings;
    std::filesystem::path data_dir;
    std::filesystem::path wallets_path{"wallets"};
    std::optional<std::string> node_name;
    std::string ipfs_binary{"ipfs"};
    size_t concurrency{1};
    validation::ValidatorSettings validator_settings;
};

struct NodeNameValidator : public CLI::Validator {
    explicit NodeNameValidator() {
        func_ = [&](const std::string& value) -> std::string {
            if (!ledger::is_node_name(value)) return "Value " + value + " is not a valid node name (e.g. node001)";
            return {};
        };
    }
};

void parse_command_line(int argc, char* argv[], CLI::App& app, ValidatorToolSettings& settings) {
    add_logging_options(app, settings.log_settings);
    add_option_data_dir(app, settings.data_dir);

    app.add_option("--wallets-path", settings.wallets_path, "Directory holding one nodeNNN sub directory per node")
        ->capture_default_str()
        ->check(CLI::ExistingDirectory);
    app.add_option("--node", settings.node_name, "Validate only the given node")
        ->check(NodeNameValidator{});
    app.add_option("--concurrency", settings.concurrency, "Number of nodes validated in parallel")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{256}));
    app.add_option("--ipfs.bin", settings.ipfs_binary, "Storage network command line binary")
        ->capture_default_str();
    app.add_flag("--dry-run", settings.validator_settings.dry_run,
                 "Report verdicts without pinning and without updating the ledger");
    app.add_option("--admitted-status", settings.validator_settings.admitted_status,
                   "Ledger status assigned to pinned tokens, unchanged when not set");

    app.parse(argc, argv);
}

static std::vector<ledger::NodeLayout> select_nodes(const ValidatorToolSettings& settings) {
    if (settings.node_name) {
        auto node{ledger::find_node(settings.wallets_path, *settings.node_name)};
        if (!node) {
            throw std::runtime_error{"node " + *settings.node_name + " not found or incomplete in " +
                                     settings.wallets_path.string()};
        }
        return {*node};
    }
    return ledger::discover_nodes(settings.wallets_path);
}

int validate(const ValidatorToolSettings& settings) {
    const auto nodes{select_nodes(settings)};
    if (nodes.empty()) {
        log::Warning("No node found", {"wallets", settings.wallets_path.string()});
        return 0;
    }
    log::Info("Nodes selected", {"count", std::to_string(nodes.size()),
                                 "dry_run", settings.validator_settings.dry_run ? "true" : "false"});

    DataDirectory data_dir{settings.data_dir};
    if (!data_dir.hash_index().exists()) {
        throw std::runtime_error{"hash index not found in " + data_dir.hash_index().path().string()};
    }
    auto env{db::open_env(db::EnvConfig{
        .path = data_dir.hash_index().path().string(),
        .readonly = true,
        .shared = true,
    })};
    db::HashIndex hash_index{env};

    const auto workflow{validation::make_node_workflow(hash_index, settings.ipfs_binary, settings.validator_settings)};
    const auto reports{validation::run_nodes(nodes, workflow, settings.concurrency)};

    int exit_code{0};
    for (const auto& report : reports) {
        if (report.stats) {
            std::ostringstream stats;
            stats << *report.stats;
            log::Info("Node completed", {"node", report.node_name, "stats", stats.str()});
        } else {
            log::Error("Node failed", {"node", report.node_name, "error", report.error});
            exit_code = 1;
        }
    }
    std::ostringstream total;
    total << validation::total_stats(reports);
    log::Info("Validation completed", {"nodes", std::to_string(reports.size()), "total", total.str()});
    return exit_code;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Token validator"};

    try {
        ValidatorToolSettings settings;
        parse_command_line(argc, argv, app, settings);

        init_logging(settings.log_settings, app, argc, argv);

        const auto pid = boost::this_process::get_id();
        RCID_INFO << "Token validator starting [pid=" << std::to_string(pid) << "]";

        const int exit_code{validate(settings)};

        RCID_INFO << "Token validator exiting [pid=" << std::to_string(pid) << "]";
        return exit_code;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        RCID_CRIT << "Token validator exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        RCID_CRIT << "Token validator exiting due to unexpected exception";
        return -3;
    }
}
