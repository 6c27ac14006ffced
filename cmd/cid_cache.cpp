// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>
#include <absl/time/time.h>
#include <boost/process/environment.hpp>
#include <magic_enum.hpp>

#include <rubicid/builder/cid_cache_builder.hpp>
#include <rubicid/core/types/token.hpp>
#include <rubicid/db/cid_cache.hpp>
#include <rubicid/db/mdbx.hpp>
#include <rubicid/infra/cli/common.hpp>
#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/common/ipfs_config.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/signal_handler.hpp>
#include <rubicid/ipfs/ipfs_cli_client.hpp>

using namespace rubicid;
using namespace rubicid::cmd::common;

//! The available subcommands in cid cache utility
//! \warning reducing the enum base type size as suggested by clang-tidy breaks CLI11
enum class CidCacheTool {  // NOLINT(performance-enum-size)
    build,
    ranges,
    get
};

//! The overall settings for the cid cache toolbox
struct CidCacheToolboxSettings {
    log::Settings log_settings;
    std::filesystem::path data_dir;
    builder::CidCacheBuildSettings build_settings;
    IpfsConfigSettings ipfs_settings;
    bool pin{false};
    std::string cid;
};

//! Parse the command-line arguments into the cid cache toolbox settings
void parse_command_line(int argc, char* argv[], CLI::App& app, CidCacheToolboxSettings& settings) {
    add_logging_options(app, settings.log_settings);
    add_option_data_dir(app, settings.data_dir);

    std::map<CidCacheTool, CLI::App*> commands;
    for (auto& [tool, name] : magic_enum::enum_entries<CidCacheTool>()) {
        commands[tool] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);
    commands[CidCacheTool::build]->description("Compute and store the cid of every token in one range of one level");
    commands[CidCacheTool::ranges]->description("List the ranges completely processed so far");
    commands[CidCacheTool::get]->description("Print the cached entry of one cid");

    auto& build_cmd = *commands[CidCacheTool::build];
    auto& build_settings = settings.build_settings;
    build_settings.end = kMaxTokenNumber;
    build_cmd.add_option("--level", build_settings.level, "Token level")
        ->required()
        ->check(CLI::Range(kMinTokenLevel, kMaxTokenLevel));
    build_cmd.add_option("--start", build_settings.start, "First token number of the range")
        ->capture_default_str()
        ->check(CLI::Range(TokenNumber{1}, kMaxTokenNumber));
    build_cmd.add_option("--end", build_settings.end, "Last token number of the range, defaults to the level limit");
    build_cmd.add_option("--workers", build_settings.num_workers, "Number of producers querying the storage network")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{1024}));
    build_cmd.add_option("--batch-size", build_settings.batch_size, "Number of entries committed per transaction")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{1'000'000}));
    build_cmd.add_option("--queue-size", build_settings.queue_size, "Capacity of the producer queue")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{10'000'000}));
    build_cmd.add_flag("--pin", settings.pin, "Store and pin the content instead of only computing its cid");
    add_ipfs_options(build_cmd, settings.ipfs_settings);

    commands[CidCacheTool::get]->add_option("--cid", settings.cid, "Cid to look up")->required();

    app.parse(argc, argv);
}

static ::mdbx::env_managed open_cid_cache(const std::filesystem::path& data_dir_path, bool readonly) {
    DataDirectory data_dir{data_dir_path, /*create=*/!readonly};
    if (readonly && !data_dir.cid_cache().exists()) {
        throw std::runtime_error{"cid cache not found in " + data_dir.cid_cache().path().string()};
    }
    return db::open_env(db::EnvConfig{
        .path = data_dir.cid_cache().path().string(),
        .create = !readonly,
        .readonly = readonly,
        .shared = readonly,
    });
}

int build(CidCacheToolboxSettings& settings) {
    ipfs::NodeContext context{
        .node_name = "builder",
        .ipfs_path = resolve_ipfs_path(settings.ipfs_settings),
        .ipfs_binary = settings.ipfs_settings.ipfs_binary,
    };
    log::Info("Storage network repository", {"path", context.ipfs_path.string()});

    auto& build_settings = settings.build_settings;
    if (settings.pin) {
        build_settings.add_options = {.only_hash = false, .pin = true};
    }

    auto env{open_cid_cache(settings.data_dir, /*readonly=*/false)};
    db::CidCacheWriter writer{env};
    builder::CidCacheBuilder cache_builder{writer, [&context]() -> std::unique_ptr<ipfs::StorageClient> {
                                               return std::make_unique<ipfs::IpfsCliClient>(context);
                                           }};

    SignalHandler::init();
    const auto result{cache_builder.build(build_settings)};
    std::ostringstream range;
    range << result.range;
    log::Info("Cid cache build",
              {"range", range.str(),
               "added", std::to_string(result.added),
               "failed", std::to_string(result.failed),
               "inserted", std::to_string(result.inserted),
               "already_present", std::to_string(result.already_present),
               "completed", result.completed ? "true" : "false"});
    return result.completed ? 0 : 1;
}

int ranges(const CidCacheToolboxSettings& settings) {
    auto env{open_cid_cache(settings.data_dir, /*readonly=*/true)};
    db::CidCacheWriter cache{env};
    const auto completed{cache.completed_ranges()};
    if (completed.empty()) {
        std::cout << "no completed range\n";
        return 0;
    }
    for (const auto& [range, completed_at] : completed) {
        std::cout << range << " completed at " << absl::FormatTime(absl::FromUnixSeconds(completed_at)) << "\n";
    }
    std::cout << "entries: " << cache.size() << "\n";
    return 0;
}

int get(const CidCacheToolboxSettings& settings) {
    auto env{open_cid_cache(settings.data_dir, /*readonly=*/true)};
    db::CidCacheReader reader{env};
    const auto entry{reader.get(settings.cid)};
    if (!entry) {
        std::cout << "not found\n";
        return 1;
    }
    std::cout << entry->cid << " " << entry->key << " content " << entry->content << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Cid cache toolbox"};

    try {
        CidCacheToolboxSettings settings;
        parse_command_line(argc, argv, app, settings);

        init_logging(settings.log_settings, app, argc, argv);

        const auto pid = boost::this_process::get_id();
        RCID_INFO << "Cid cache toolbox starting [pid=" << std::to_string(pid) << "]";

        auto command_name = app.get_subcommands().front()->get_name();
        auto tool = magic_enum::enum_cast<CidCacheTool>(command_name).value();

        int exit_code{0};
        switch (tool) {
            case CidCacheTool::build:
                exit_code = build(settings);
                break;
            case CidCacheTool::ranges:
                exit_code = ranges(settings);
                break;
            case CidCacheTool::get:
                exit_code = get(settings);
                break;
        }

        RCID_INFO << "Cid cache toolbox exiting [pid=" << std::to_string(pid) << "]";
        return exit_code;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        RCID_CRIT << "Cid cache toolbox exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        RCID_CRIT << "Cid cache toolbox exiting due to unexpected exception";
        return -3;
    }
}
