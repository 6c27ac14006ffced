// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <rubicid/infra/common/directories.hpp>

namespace rubicid::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir) {
    cli.add_option("--datadir", data_dir, "The path to the index data directory")
        ->default_val(DataDirectory::get_default_storage_path().string());
}

void add_ipfs_options(CLI::App& cli, IpfsConfigSettings& settings) {
    auto& ipfs_opts = *cli.add_option_group("IPFS", "Storage network options");
    ipfs_opts.add_option("--ipfs.path", settings.ipfs_path, "Repository path of the node (IPFS_PATH)")
        ->check(CLI::ExistingDirectory);
    ipfs_opts.add_option("--ipfs.config", settings.config_file, "Config file holding an IPFS_PATH=<path> line")
        ->capture_default_str();
    ipfs_opts.add_option("--ipfs.bin", settings.ipfs_binary, "Storage network command line binary")
        ->capture_default_str();
}

//! \brief Set up parsing of the number of serving execution contexts (i.e. threading model)
static void add_option_num_contexts(CLI::App& cli, uint32_t& num_contexts) {
    cli.add_option("--contexts", num_contexts, "The number of execution contexts")
        ->check(CLI::Range(1u, 1024u))
        ->default_val(concurrency::kDefaultNumContexts);
}

void add_context_pool_options(CLI::App& cli, concurrency::ContextPoolSettings& settings) {
    add_option_num_contexts(cli, settings.num_contexts);
}

void init_logging(const log::Settings& log_settings, const CLI::App& cli, int argc, char* argv[]) {
    log::init(log_settings);
    log::set_thread_name("main");
    std::string command_line{argv[0]};
    for (int i{1}; i < argc; ++i) {
        command_line += " ";
        command_line += argv[i];
    }
    log::Info(cli.get_name(), {"command", command_line});
}

}  // namespace rubicid::cmd::common
