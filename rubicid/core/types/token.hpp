// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <rubicid/core/common/bytes.hpp>
#include <rubicid/core/common/decoding_result.hpp>

namespace rubicid {

using TokenLevel = uint8_t;
using TokenNumber = uint32_t;
using TokenHash = std::array<uint8_t, kHashLength>;

inline constexpr TokenLevel kMinTokenLevel{1};
inline constexpr TokenLevel kMaxTokenLevel{4};

//! Maximum token number issued in each level, indexed by level - 1
inline constexpr std::array<TokenNumber, kMaxTokenLevel> kLevelLimits{4'300'000, 2'425'000, 2'303'750, 2'188'563};

//! Highest token number among all levels
inline constexpr TokenNumber kMaxTokenNumber{4'300'000};

//! Number of ASCII digits encoding the level in token content
inline constexpr size_t kLevelDigits{3};

//! Number of hex characters encoding the hash in token content
inline constexpr size_t kHashHexLength{2 * kHashLength};

//! Total token content length
inline constexpr size_t kTokenContentLength{kLevelDigits + kHashHexLength};

constexpr bool is_valid_level(int level) noexcept {
    return level >= kMinTokenLevel && level <= kMaxTokenLevel;
}

//! \brief Maximum token number for the given level, std::nullopt for an unknown level
constexpr std::optional<TokenNumber> level_limit(int level) noexcept {
    if (!is_valid_level(level)) return std::nullopt;
    return kLevelLimits[static_cast<size_t>(level - 1)];
}

//! \brief The identity of one token in the issuance universe
struct TokenKey {
    TokenLevel level{0};
    TokenNumber number{0};

    //! Whether 1 <= number <= limit of level
    bool is_valid() const noexcept;

    friend bool operator==(const TokenKey&, const TokenKey&) = default;
};

std::ostream& operator<<(std::ostream& out, const TokenKey& key);

//! \brief The highest level whose range contains the given number, std::nullopt if none does
std::optional<TokenLevel> highest_level_for(TokenNumber number) noexcept;

//! \brief SHA-256 of the decimal representation of the token number
TokenHash token_hash(TokenNumber number);

//! \brief Lowercase hex form of \ref token_hash
std::string token_hash_hex(TokenNumber number);

//! \brief The decoded form of token content: level plus content hash
struct TokenContent {
    TokenLevel level{0};
    TokenHash hash{};

    //! Canonical textual form: zero-padded level followed by lowercase hex hash
    std::string to_string() const;

    friend bool operator==(const TokenContent&, const TokenContent&) = default;
};

//! \brief Canonical content of the given token
TokenContent make_token_content(const TokenKey& key);

//! \brief Decode the fixed 3+64 layout, hex digits accepted in either case
//! \details Decoding operates on the exact input: trim before calling when needed
tl::expected<TokenContent, DecodingError> decode_token_content(std::string_view content);

}  // namespace rubicid
