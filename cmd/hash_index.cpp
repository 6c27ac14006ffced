// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/process/environment.hpp>
#include <magic_enum.hpp>

#include <rubicid/builder/hash_index_builder.hpp>
#include <rubicid/core/common/util.hpp>
#include <rubicid/core/types/token.hpp>
#include <rubicid/db/hash_index.hpp>
#include <rubicid/db/mdbx.hpp>
#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/common/log.hpp>
#include <rubicid/infra/concurrency/signal_handler.hpp>
#include <rubicid/infra/cli/common.hpp>

using namespace rubicid;
using namespace rubicid::cmd::common;

//! The available subcommands in hash index utility
//! \warning reducing the enum base type size as suggested by clang-tidy breaks CLI11
enum class HashIndexTool {  // NOLINT(performance-enum-size)
    build,
    verify,
    lookup
};

//! The overall settings for the hash index toolbox
struct HashIndexToolboxSettings {
    log::Settings log_settings;
    std::filesystem::path data_dir;
    builder::HashIndexBuildSettings build_settings;
    builder::HashIndexVerifySettings verify_settings;
    std::string lookup_hash;
};

struct HashValidator : public CLI::Validator {
    explicit HashValidator() {
        func_ = [&](const std::string& value) -> std::string {
            const auto bytes{from_hex(value)};
            if (!bytes || bytes->size() != kHashLength) return "Value " + value + " is not a valid 32-byte hash";
            return {};
        };
    }
};

//! Parse the command-line arguments into the hash index toolbox settings
void parse_command_line(int argc, char* argv[], CLI::App& app, HashIndexToolboxSettings& settings) {
    add_logging_options(app, settings.log_settings);
    add_option_data_dir(app, settings.data_dir);

    std::map<HashIndexTool, CLI::App*> commands;
    for (auto& [tool, name] : magic_enum::enum_entries<HashIndexTool>()) {
        commands[tool] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);
    commands[HashIndexTool::build]->description("Hash every token number and store the hash => token map");
    commands[HashIndexTool::verify]->description("Check stored entries against freshly derived ones");
    commands[HashIndexTool::lookup]->description("Print the token addressed by one hash");

    auto& build_settings = settings.build_settings;
    auto& verify_settings = settings.verify_settings;
    for (auto& cmd : {commands[HashIndexTool::build], commands[HashIndexTool::verify]}) {
        auto& levels = cmd == commands[HashIndexTool::build] ? build_settings.levels : verify_settings.levels;
        auto& last = cmd == commands[HashIndexTool::build] ? build_settings.last_number : verify_settings.last_number;
        cmd->add_option("--levels", levels, "Token levels covered by the index")
            ->capture_default_str()
            ->check(CLI::Range(kMinTokenLevel, kMaxTokenLevel));
        cmd->add_option("--last", last, "Highest token number covered, defaults to the highest one of the levels")
            ->check(CLI::Range(TokenNumber{1}, kMaxTokenNumber));
    }

    commands[HashIndexTool::build]
        ->add_option("--batch-size", build_settings.batch_size, "Number of entries committed per transaction")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{10'000'000}));
    commands[HashIndexTool::build]
        ->add_option("--workers", build_settings.num_workers, "Number of hashing workers")
        ->capture_default_str()
        ->check(CLI::Range(size_t{1}, size_t{1024}));
    commands[HashIndexTool::build]
        ->add_flag("--force", build_settings.force, "Discard any previous content and rebuild from scratch");

    commands[HashIndexTool::verify]
        ->add_option("--sample", verify_settings.sample_size, "Number of random token numbers checked")
        ->capture_default_str();
    commands[HashIndexTool::verify]
        ->add_flag("--full", verify_settings.full, "Check every token number instead of a sample");
    commands[HashIndexTool::verify]
        ->add_option("--seed", verify_settings.seed, "Seed of the random sample");

    commands[HashIndexTool::lookup]
        ->add_option("--hash", settings.lookup_hash, "Hex token hash to look up")
        ->required()
        ->check(HashValidator{});

    app.parse(argc, argv);
}

static ::mdbx::env_managed open_hash_index(const std::filesystem::path& data_dir_path, bool readonly) {
    DataDirectory data_dir{data_dir_path, /*create=*/!readonly};
    if (readonly && !data_dir.hash_index().exists()) {
        throw std::runtime_error{"hash index not found in " + data_dir.hash_index().path().string()};
    }
    return db::open_env(db::EnvConfig{
        .path = data_dir.hash_index().path().string(),
        .create = !readonly,
        .readonly = readonly,
        .shared = readonly,
    });
}

int build(const HashIndexToolboxSettings& settings) {
    auto env{open_hash_index(settings.data_dir, /*readonly=*/false)};
    db::HashIndex index{env};
    builder::HashIndexBuilder index_builder{index};

    SignalHandler::init();
    const auto result{index_builder.build(settings.build_settings)};
    log::Info("Hash index build",
              {"first", std::to_string(result.first_number),
               "watermark", std::to_string(result.watermark),
               "written", std::to_string(result.written),
               "completed", result.completed ? "true" : "false"});
    return result.completed ? 0 : 1;
}

int verify(const HashIndexToolboxSettings& settings) {
    auto env{open_hash_index(settings.data_dir, /*readonly=*/true)};
    db::HashIndex index{env};
    builder::HashIndexBuilder index_builder{index};

    SignalHandler::init();
    const auto report{index_builder.verify(settings.verify_settings)};
    log::Info("Hash index verify",
              {"mode", settings.verify_settings.full ? "full" : "sample",
               "checked", std::to_string(report.checked),
               "missing", std::to_string(report.missing),
               "mismatched", std::to_string(report.mismatched),
               "entries", std::to_string(report.entries),
               "expected", std::to_string(report.expected_entries)});
    if (!report.ok()) {
        log::Error("Hash index verification failed");
        return 1;
    }
    return 0;
}

int lookup(const HashIndexToolboxSettings& settings) {
    auto env{open_hash_index(settings.data_dir, /*readonly=*/true)};
    db::HashIndex index{env};

    const auto bytes{from_hex(settings.lookup_hash)};
    TokenHash hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    const auto key{index.lookup(hash)};
    if (!key) {
        std::cout << "not found\n";
        return 1;
    }
    std::cout << *key << " content " << make_token_content(*key).to_string() << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Hash index toolbox"};

    try {
        HashIndexToolboxSettings settings;
        parse_command_line(argc, argv, app, settings);

        init_logging(settings.log_settings, app, argc, argv);

        const auto pid = boost::this_process::get_id();
        RCID_INFO << "Hash index toolbox starting [pid=" << std::to_string(pid) << "]";

        auto command_name = app.get_subcommands().front()->get_name();
        auto tool = magic_enum::enum_cast<HashIndexTool>(command_name).value();

        int exit_code{0};
        switch (tool) {
            case HashIndexTool::build:
                exit_code = build(settings);
                break;
            case HashIndexTool::verify:
                exit_code = verify(settings);
                break;
            case HashIndexTool::lookup:
                exit_code = lookup(settings);
                break;
        }

        RCID_INFO << "Hash index toolbox exiting [pid=" << std::to_string(pid) << "]";
        return exit_code;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        RCID_CRIT << "Hash index toolbox exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        RCID_CRIT << "Hash index toolbox exiting due to unexpected exception";
        return -3;
    }
}
