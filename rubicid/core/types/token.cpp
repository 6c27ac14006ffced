// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "token.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <iterator>

#include <evmone_precompiles/sha256.hpp>

#include <rubicid/core/common/util.hpp>

namespace rubicid {

bool TokenKey::is_valid() const noexcept {
    const auto limit{level_limit(level)};
    return limit && number >= 1 && number <= *limit;
}

std::ostream& operator<<(std::ostream& out, const TokenKey& key) {
    out << "level=" << static_cast<int>(key.level) << " number=" << key.number;
    return out;
}

std::optional<TokenLevel> highest_level_for(TokenNumber number) noexcept {
    if (number == 0) return std::nullopt;
    for (TokenLevel level{kMaxTokenLevel}; level >= kMinTokenLevel; --level) {
        if (number <= kLevelLimits[level - 1]) {
            return level;
        }
    }
    return std::nullopt;
}

TokenHash token_hash(TokenNumber number) {
    char decimal[16];
    const auto [end, ec]{std::to_chars(std::begin(decimal), std::end(decimal), number)};
    TokenHash hash{};
    evmone::crypto::sha256(reinterpret_cast<std::byte*>(hash.data()),
                           reinterpret_cast<const std::byte*>(decimal),
                           static_cast<size_t>(end - decimal));
    return hash;
}

std::string token_hash_hex(TokenNumber number) {
    const auto hash{token_hash(number)};
    return to_hex({hash.data(), hash.size()});
}

std::string TokenContent::to_string() const {
    char level_digits[kLevelDigits + 1];
    std::snprintf(level_digits, sizeof(level_digits), "%03u", static_cast<unsigned>(level));
    std::string out{level_digits};
    out.reserve(kTokenContentLength);
    out += to_hex({hash.data(), hash.size()});
    return out;
}

TokenContent make_token_content(const TokenKey& key) {
    return {.level = key.level, .hash = token_hash(key.number)};
}

tl::expected<TokenContent, DecodingError> decode_token_content(std::string_view content) {
    if (content.length() != kTokenContentLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    int level{0};
    for (size_t i{0}; i < kLevelDigits; ++i) {
        const char c{content[i]};
        if (c < '0' || c > '9') {
            return tl::unexpected{DecodingError::kInvalidLevel};
        }
        level = level * 10 + (c - '0');
    }
    if (!is_valid_level(level)) {
        return tl::unexpected{DecodingError::kInvalidLevel};
    }

    const auto hash_part{content.substr(kLevelDigits)};
    if (!is_hex(hash_part)) {
        return tl::unexpected{DecodingError::kInvalidHexDigit};
    }
    const auto hash_bytes{from_hex(hash_part)};
    if (!hash_bytes || hash_bytes->size() != kHashLength) {
        return tl::unexpected{DecodingError::kInvalidHexDigit};
    }
    TokenContent decoded{.level = static_cast<TokenLevel>(level)};
    std::copy(hash_bytes->cbegin(), hash_bytes->cend(), decoded.hash.begin());
    return decoded;
}

}  // namespace rubicid
