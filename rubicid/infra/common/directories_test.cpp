// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <fstream>

#include <catch2/catch.hpp>

namespace rubicid {

TEST_CASE("TemporaryDirectory", "[rubicid][infra][common][directories]") {
    std::filesystem::path tmp_path;
    {
        const TemporaryDirectory tmp_dir;
        tmp_path = tmp_dir.path();
        CHECK(tmp_dir.exists());
        CHECK(tmp_dir.is_empty());

        std::ofstream file{tmp_path / "marker.txt"};
        file << "marker";
        file.close();
        CHECK_FALSE(tmp_dir.is_empty());
    }
    CHECK_FALSE(std::filesystem::exists(tmp_path));
}

TEST_CASE("DataDirectory", "[rubicid][infra][common][directories]") {
    const TemporaryDirectory tmp_dir;

    SECTION("lazy tree") {
        DataDirectory data_dir{tmp_dir.path() / "data"};
        CHECK_FALSE(data_dir.exists());
        CHECK_FALSE(data_dir.hash_index().exists());
        data_dir.deploy();
        CHECK(data_dir.hash_index().exists());
        CHECK(data_dir.cid_cache().exists());
        CHECK(data_dir.logs().exists());
    }

    SECTION("created tree") {
        DataDirectory data_dir{tmp_dir.path() / "data", /*create=*/true};
        CHECK(data_dir.cid_cache().exists());
        CHECK(data_dir.hash_index().path() == tmp_dir.path() / "data" / "hashindex");
        CHECK_THROWS_AS(data_dir.clear(), std::runtime_error);
    }
}

}  // namespace rubicid
