// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ipfs_cli_client.hpp"

#include <cstdlib>
#include <fstream>

#include <catch2/catch.hpp>

#include <rubicid/infra/common/directories.hpp>
#include <rubicid/infra/test_util/log.hpp>

namespace rubicid::ipfs {

//! Shell script mimicking the few storage network commands used by the client
static constexpr std::string_view kFakeIpfsScript{R"(#!/bin/sh
case "$1" in
  cat)
    if [ "$2" = "QmSlow" ]; then sleep 5; fi
    if [ "$2" = "QmMissing" ]; then echo "Error: block was not found locally" >&2; exit 1; fi
    printf '%s' "$IPFS_PATH"
    ;;
  add)
    input=$(cat)
    printf '%s|%s\n' "$input" "$*"
    ;;
  pin)
    if [ "$2" = "ls" ]; then
      if [ -f "$IPFS_PATH/pinned_$3" ]; then echo "$3 recursive"; exit 0; fi
      echo "Error: path '$3' is not pinned" >&2
      exit 1
    fi
    if [ "$3" = "QmUnpinnable" ]; then echo "Error: pin: context deadline exceeded" >&2; exit 1; fi
    touch "$IPFS_PATH/pinned_$3" && echo "pinned $3 recursively"
    ;;
  *)
    exit 2
    ;;
esac
)"};

static std::filesystem::path write_fake_ipfs(const std::filesystem::path& dir) {
    const auto script_path{dir / "fake-ipfs"};
    {
        std::ofstream script{script_path};
        script << kFakeIpfsScript;
    }
    std::filesystem::permissions(script_path, std::filesystem::perms::owner_all);
    return script_path;
}

TEST_CASE("IpfsCliClient", "[rubicid][ipfs][cli_client]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    const auto fake_ipfs{write_fake_ipfs(tmp_dir.path())};
    const auto repo_a{tmp_dir.path() / "node001" / ".ipfs"};
    const auto repo_b{tmp_dir.path() / "node002" / ".ipfs"};
    std::filesystem::create_directories(repo_a);
    std::filesystem::create_directories(repo_b);

    IpfsCliClient client_a{NodeContext{.node_name = "node001", .ipfs_path = repo_a, .ipfs_binary = fake_ipfs.string()}};
    IpfsCliClient client_b{NodeContext{.node_name = "node002", .ipfs_path = repo_b, .ipfs_binary = fake_ipfs.string()}};

    SECTION("each client runs with its own repository") {
        const char* parent_value_before{std::getenv("IPFS_PATH")};
        const std::string before{parent_value_before ? parent_value_before : ""};
        CHECK(client_a.fetch("QmAny") == repo_a.string());
        CHECK(client_b.fetch("QmAny") == repo_b.string());
        const char* parent_value_after{std::getenv("IPFS_PATH")};
        CHECK(before == (parent_value_after ? parent_value_after : ""));
    }

    SECTION("fetch failure") {
        CHECK_THROWS_AS(client_a.fetch("QmMissing"), FetchError);
    }

    SECTION("fetch timeout") {
        IpfsCliClient impatient{NodeContext{
            .node_name = "node001",
            .ipfs_path = repo_a,
            .ipfs_binary = fake_ipfs.string(),
            .fetch_timeout = std::chrono::milliseconds{200},
        }};
        CHECK_THROWS_AS(impatient.fetch("QmSlow"), FetchError);
    }

    SECTION("add passes content on stdin") {
        CHECK(client_a.add("003abc", AddOptions{}) == "003abc|add --pin=false --only-hash -Q");
        CHECK(client_a.add("003abc", AddOptions{.only_hash = false, .pin = true}) == "003abc|add --pin=true -Q");
    }

    SECTION("ensure_pinned pins only once") {
        CHECK_FALSE(client_a.is_pinned("QmToken"));
        client_a.ensure_pinned("QmToken");
        CHECK(client_a.is_pinned("QmToken"));
        CHECK_FALSE(client_b.is_pinned("QmToken"));
        CHECK_NOTHROW(client_a.ensure_pinned("QmToken"));
    }

    SECTION("pin failure") {
        CHECK_THROWS_AS(client_a.ensure_pinned("QmUnpinnable"), PinError);
    }
}

TEST_CASE("IpfsCliClient: missing binary", "[rubicid][ipfs][cli_client]") {
    CHECK_THROWS_AS(IpfsCliClient{NodeContext{.ipfs_binary = "rubicid-no-such-ipfs-binary"}}, StorageError);
}

TEST_CASE("IpfsCliClient: command failures map to the operation error", "[rubicid][ipfs][cli_client]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const TemporaryDirectory tmp_dir;
    const auto not_executable{tmp_dir.path() / "ipfs"};
    {
        std::ofstream file{not_executable};
        file << "not a program";
    }
    std::filesystem::permissions(not_executable, std::filesystem::perms::owner_read);

    IpfsCliClient client{NodeContext{.node_name = "node001", .ipfs_path = tmp_dir.path(),
                                     .ipfs_binary = not_executable.string()}};
    CHECK_THROWS_AS(client.fetch("QmAny"), FetchError);
    CHECK_THROWS_AS(client.add("003abc", AddOptions{}), AddError);
    CHECK_THROWS_AS(client.ensure_pinned("QmAny"), PinError);
}

}  // namespace rubicid::ipfs
