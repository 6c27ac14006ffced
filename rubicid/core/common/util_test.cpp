// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <catch2/catch.hpp>

namespace rubicid {

TEST_CASE("to_hex", "[rubicid][core][common][util]") {
    const Bytes bytes{0x00, 0x1f, 0xab, 0xff};
    CHECK(to_hex(bytes) == "001fabff");
    CHECK(to_hex(bytes, /*with_prefix=*/true) == "0x001fabff");
    CHECK(to_hex(ByteView{}).empty());
}

TEST_CASE("from_hex", "[rubicid][core][common][util]") {
    CHECK(from_hex("001fabff") == Bytes{0x00, 0x1f, 0xab, 0xff});
    CHECK(from_hex("0x001FABff") == Bytes{0x00, 0x1f, 0xab, 0xff});
    CHECK(from_hex("") == Bytes{});
    CHECK_FALSE(from_hex("abc"));
    CHECK_FALSE(from_hex("zz"));
    CHECK_FALSE(from_hex("0g"));
}

TEST_CASE("decode_hex_digit", "[rubicid][core][common][util]") {
    CHECK(decode_hex_digit('0') == 0);
    CHECK(decode_hex_digit('9') == 9);
    CHECK(decode_hex_digit('a') == 10);
    CHECK(decode_hex_digit('F') == 15);
    CHECK_FALSE(decode_hex_digit('g'));
    CHECK_FALSE(decode_hex_digit(' '));
}

TEST_CASE("is_hex", "[rubicid][core][common][util]") {
    CHECK(is_hex("0123456789abcdefABCDEF"));
    CHECK(is_hex(""));
    CHECK_FALSE(is_hex("12 34"));
    CHECK_FALSE(is_hex("xyz"));
}

TEST_CASE("iequals", "[rubicid][core][common][util]") {
    CHECK(iequals("QmAbC", "qmabc"));
    CHECK_FALSE(iequals("QmAbC", "qmab"));
}

TEST_CASE("trim and abridge", "[rubicid][core][common][util]") {
    CHECK(trim("  \t QmCid\n") == "QmCid");
    CHECK(trim("\n\r ").empty());
    CHECK(abridge("0123456789", 4) == "0123...");
    CHECK(abridge("0123", 4) == "0123");
}

TEST_CASE("human_size", "[rubicid][core][common][util]") {
    CHECK(human_size(0) == "0.00 B");
    CHECK(human_size(1024) == "1.00 KB");
    CHECK(human_size(1536 * 1024) == "1.50 MB");
    CHECK(human_size(3ull * 1024 * 1024 * 1024 * 1024) == "3.00 TB");
}

}  // namespace rubicid
