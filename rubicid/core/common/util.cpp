// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include <absl/strings/ascii.h>

#include <rubicid/core/common/base.hpp>

namespace rubicid {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (hex.length() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out(hex.length() / 2, '\0');
    for (size_t i{0}; i < out.length(); ++i) {
        const auto hi{decode_hex_digit(hex[2 * i])};
        const auto lo{decode_hex_digit(hex[2 * i + 1])};
        if (!hi || !lo) {
            return std::nullopt;
        }
        out[i] = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

bool is_hex(std::string_view input) noexcept {
    return std::all_of(input.cbegin(), input.cend(), [](char c) { return decode_hex_digit(c).has_value(); });
}

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.cbegin(), a.cend(), b.cbegin(), b.cend(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string human_size(uint64_t bytes, const char* unit) {
    static const char* suffix[]{"", "K", "M", "G", "T"};
    static const uint32_t items{sizeof(suffix) / sizeof(suffix[0])};
    uint32_t index{0};
    double value{static_cast<double>(bytes)};
    while (value >= kKibi) {
        value /= kKibi;
        if (++index == (items - 1)) {
            break;
        }
    }
    char output[64];
    std::snprintf(output, sizeof(output), "%.02lf %s%s", value, suffix[index], unit);
    return output;
}

std::string_view trim(std::string_view input) {
    return absl::StripAsciiWhitespace(input);
}

}  // namespace rubicid
