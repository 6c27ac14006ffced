// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ipfs_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include <rubicid/infra/common/log.hpp>

namespace rubicid {

static std::string_view strip_quotes(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::string> parse_ipfs_config(std::istream& input) {
    const std::string prefix{std::string{kIpfsPathKey} + "="};
    std::string line;
    while (std::getline(input, line)) {
        const std::string_view stripped{absl::StripAsciiWhitespace(line)};
        if (stripped.empty() || stripped.front() == '#') continue;
        if (!absl::StartsWith(stripped, prefix)) continue;
        const auto value{strip_quotes(absl::StripAsciiWhitespace(stripped.substr(prefix.size())))};
        if (!value.empty()) {
            return std::string{value};
        }
    }
    return std::nullopt;
}

static bool is_existing_path(const std::filesystem::path& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::exists(path, ec);
}

std::filesystem::path resolve_ipfs_path(const IpfsConfigSettings& settings, const std::optional<std::string>& env_value) {
    if (settings.ipfs_path) {
        if (!is_existing_path(*settings.ipfs_path)) {
            throw std::runtime_error{"IPFS_PATH does not exist: " + settings.ipfs_path->string()};
        }
        return *settings.ipfs_path;
    }
    if (env_value && is_existing_path(*env_value)) {
        RCID_DEBUG << "IPFS_PATH resolved from environment: " << *env_value;
        return *env_value;
    }
    std::ifstream config_stream{settings.config_file};
    if (config_stream) {
        const auto config_value{parse_ipfs_config(config_stream)};
        if (config_value && is_existing_path(*config_value)) {
            RCID_DEBUG << "IPFS_PATH resolved from " << settings.config_file.string() << ": " << *config_value;
            return *config_value;
        }
    }
    throw std::runtime_error{"IPFS_PATH not configured: set it in " + settings.config_file.string() +
                             " or in the environment (e.g. IPFS_PATH=/home/user/wallets/node002/node002/.ipfs)"};
}

std::filesystem::path resolve_ipfs_path(const IpfsConfigSettings& settings) {
    const char* env_value{std::getenv(kIpfsPathKey)};
    return resolve_ipfs_path(settings, env_value ? std::make_optional<std::string>(env_value) : std::nullopt);
}

}  // namespace rubicid
