// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <string>

#include <CLI/CLI.hpp>

#include <rubicid/infra/cli/common.hpp>
#include <rubicid/infra/cli/ip_endpoint_option.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/lookup/daemon.hpp>
#include <rubicid/lookup/settings.hpp>

using namespace rubicid;
using namespace rubicid::cmd::common;

void parse_command_line(int argc, char* argv[], CLI::App& cli, lookup::DaemonSettings& settings) {
    add_logging_options(cli, settings.log_settings);
    add_option_data_dir(cli, settings.data_dir);
    add_context_pool_options(cli, settings.context_pool_settings);

    add_option_ip_endpoint(cli, "--http.addr", settings.http_end_point, "HTTP server listening address (ip:port)");
    cli.add_option("--cache.size", settings.hot_cache_size, "Number of entries kept in the in-memory hot cache")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{100'000'000}));
    cli.add_option("--batch.max", settings.max_batch_size, "Maximum number of cids accepted by one batch request")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{1'000'000}));

    cli.parse(argc, argv);
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Token CID lookup daemon"};

    try {
        lookup::DaemonSettings settings;
        parse_command_line(argc, argv, cli, settings);

        init_logging(settings.log_settings, cli, argc, argv);

        return lookup::Daemon::run(settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    } catch (const std::exception& e) {
        RCID_CRIT << "Lookup daemon exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        RCID_CRIT << "Lookup daemon exiting due to unexpected exception";
        return -3;
    }
}
