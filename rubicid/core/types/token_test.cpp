// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "token.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <catch2/catch.hpp>

#include <rubicid/core/common/decoding_exception.hpp>

namespace rubicid {

static constexpr std::string_view kHash1662242{"f4a5ac9cd7498503f8ab1b5f4f62454703e3cfef47886861d776819d3be9fdbb"};

TEST_CASE("level_limit", "[rubicid][core][types][token]") {
    CHECK(level_limit(1) == 4'300'000u);
    CHECK(level_limit(2) == 2'425'000u);
    CHECK(level_limit(3) == 2'303'750u);
    CHECK(level_limit(4) == 2'188'563u);
    CHECK_FALSE(level_limit(0));
    CHECK_FALSE(level_limit(5));
    CHECK(kMaxTokenNumber == *level_limit(1));
}

TEST_CASE("TokenKey::is_valid", "[rubicid][core][types][token]") {
    CHECK(TokenKey{.level = 1, .number = 1}.is_valid());
    CHECK(TokenKey{.level = 1, .number = 4'300'000}.is_valid());
    CHECK_FALSE(TokenKey{.level = 1, .number = 4'300'001}.is_valid());
    CHECK(TokenKey{.level = 4, .number = 2'188'563}.is_valid());
    CHECK_FALSE(TokenKey{.level = 4, .number = 2'188'564}.is_valid());
    CHECK_FALSE(TokenKey{.level = 2, .number = 0}.is_valid());
    CHECK_FALSE(TokenKey{.level = 0, .number = 10}.is_valid());
    CHECK_FALSE(TokenKey{.level = 5, .number = 10}.is_valid());
}

TEST_CASE("highest_level_for", "[rubicid][core][types][token]") {
    CHECK_FALSE(highest_level_for(0));
    CHECK(highest_level_for(1) == 4);
    CHECK(highest_level_for(2'188'563) == 4);
    CHECK(highest_level_for(2'188'564) == 3);
    CHECK(highest_level_for(2'303'751) == 2);
    CHECK(highest_level_for(2'425'001) == 1);
    CHECK(highest_level_for(4'300'000) == 1);
    CHECK_FALSE(highest_level_for(4'300'001));
}

TEST_CASE("token_hash", "[rubicid][core][types][token]") {
    CHECK(token_hash_hex(1) == "6b86b273ff34fce19d6b804eff5a3f5747ada4eaa22f1d49c01e52ddb7875b4b");
    CHECK(token_hash_hex(1'662'242) == kHash1662242);
    CHECK(token_hash_hex(4'300'000) == "b29ab115ae918ee05314eb367457ff6a44b9038035c374dd3f876946fd78450f");

    std::set<TokenHash> hashes;
    for (TokenNumber number{1}; number <= 1000; ++number) {
        hashes.insert(token_hash(number));
    }
    CHECK(hashes.size() == 1000);
}

TEST_CASE("make_token_content", "[rubicid][core][types][token]") {
    const auto content{make_token_content({.level = 3, .number = 1'662'242})};
    CHECK(content.level == 3);
    CHECK(content.to_string() == "003" + std::string{kHash1662242});
    CHECK(content.to_string().size() == kTokenContentLength);
}

TEST_CASE("decode_token_content", "[rubicid][core][types][token]") {
    const std::string canonical{"003" + std::string{kHash1662242}};

    SECTION("canonical content") {
        const auto decoded{decode_token_content(canonical)};
        REQUIRE(decoded);
        CHECK(decoded->level == 3);
        CHECK(decoded->hash == token_hash(1'662'242));
        CHECK(decoded->to_string() == canonical);
    }
    SECTION("uppercase hex is accepted and canonicalized") {
        std::string upper{canonical};
        std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) { return std::toupper(c); });
        const auto decoded{decode_token_content(upper)};
        REQUIRE(decoded);
        CHECK(decoded->to_string() == canonical);
    }
    SECTION("wrong length") {
        CHECK(decode_token_content("").error() == DecodingError::kUnexpectedLength);
        CHECK(decode_token_content(canonical.substr(1)).error() == DecodingError::kUnexpectedLength);
        CHECK(decode_token_content(canonical + "0").error() == DecodingError::kUnexpectedLength);
        CHECK(decode_token_content(" " + canonical).error() == DecodingError::kUnexpectedLength);
    }
    SECTION("invalid level") {
        CHECK(decode_token_content("000" + std::string{kHash1662242}).error() == DecodingError::kInvalidLevel);
        CHECK(decode_token_content("005" + std::string{kHash1662242}).error() == DecodingError::kInvalidLevel);
        CHECK(decode_token_content("0x3" + std::string{kHash1662242}).error() == DecodingError::kInvalidLevel);
        CHECK(decode_token_content("+03" + std::string{kHash1662242}).error() == DecodingError::kInvalidLevel);
    }
    SECTION("non-hex hash") {
        std::string bad{canonical};
        bad[10] = 'g';
        CHECK(decode_token_content(bad).error() == DecodingError::kInvalidHexDigit);
        CHECK(decode_token_content("0030x" + std::string{kHash1662242.substr(2)}).error() ==
              DecodingError::kInvalidHexDigit);
    }
    SECTION("throwing callers") {
        CHECK_THROWS_AS(unwrap_or_throw(decode_token_content("bad")), DecodingException);
        CHECK(unwrap_or_throw(decode_token_content(canonical)).level == 3);
    }
}

}  // namespace rubicid
