// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "base58.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace rubicid {

static constexpr std::string_view kAlphabet{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

static constexpr std::array<int8_t, 128> make_reverse_alphabet() {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (size_t i{0}; i < kAlphabet.size(); ++i) {
        table[static_cast<size_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

static constexpr auto kReverseAlphabet{make_reverse_alphabet()};

std::string encode_base58(ByteView data) {
    const auto leading_zeros{static_cast<size_t>(
        std::find_if(data.cbegin(), data.cend(), [](uint8_t b) { return b != 0; }) - data.cbegin())};

    // log(256) / log(58) rounded up
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length{0};
    for (size_t i{leading_zeros}; i < data.size(); ++i) {
        unsigned carry{data[i]};
        size_t j{0};
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it{digits.cbegin() + static_cast<std::ptrdiff_t>(digits.size() - length)};
    while (it != digits.cend() && *it == 0) {
        ++it;
    }
    std::string out(leading_zeros, '1');
    out.reserve(leading_zeros + static_cast<size_t>(digits.cend() - it));
    for (; it != digits.cend(); ++it) {
        out.push_back(kAlphabet[*it]);
    }
    return out;
}

std::optional<Bytes> decode_base58(std::string_view encoded) {
    const auto leading_ones{static_cast<size_t>(
        std::find_if(encoded.cbegin(), encoded.cend(), [](char c) { return c != '1'; }) - encoded.cbegin())};

    // log(58) / log(256) rounded up
    std::vector<uint8_t> bytes((encoded.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t length{0};
    for (size_t i{leading_ones}; i < encoded.size(); ++i) {
        const auto ch{static_cast<unsigned char>(encoded[i])};
        if (ch >= kReverseAlphabet.size() || kReverseAlphabet[ch] < 0) {
            return std::nullopt;
        }
        unsigned carry{static_cast<unsigned>(kReverseAlphabet[ch])};
        size_t j{0};
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58u * *it;
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it{bytes.cbegin() + static_cast<std::ptrdiff_t>(bytes.size() - length)};
    while (it != bytes.cend() && *it == 0) {
        ++it;
    }
    Bytes out(leading_ones, 0);
    out.append(it, bytes.cend());
    return out;
}

}  // namespace rubicid
