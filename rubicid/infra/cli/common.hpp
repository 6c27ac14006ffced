// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <CLI/CLI.hpp>

#include <rubicid/infra/common/ipfs_config.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/context_pool_settings.hpp>

namespace rubicid::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the data directory path
void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir);

//! \brief Set up options locating the storage network repository and binary
void add_ipfs_options(CLI::App& cli, IpfsConfigSettings& settings);

//! \brief Set up context pool options
void add_context_pool_options(CLI::App& cli, concurrency::ContextPoolSettings& settings);

//! \brief Initialize logging and print the command line the tool was started with
void init_logging(const log::Settings& log_settings, const CLI::App& cli, int argc, char* argv[]);

}  // namespace rubicid::cmd::common
