// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <rubicid/core/common/bytes.hpp>

namespace rubicid {

//! \brief Returns a string representing the hex form of provided string of bytes (lowercase digits)
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

//! \brief Decodes one hex digit (either case) into its value
std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string (either case, optional 0x prefix) into bytes
//! \return std::nullopt on odd length or invalid digits
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Whether the input is made of hex digits only (either case)
bool is_hex(std::string_view input) noexcept;

//! \brief Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

//! \brief Converts a number of bytes in a human-readable format
std::string human_size(uint64_t bytes, const char* unit = "B");

//! \brief Removes leading and trailing ASCII whitespace
std::string_view trim(std::string_view input);

}  // namespace rubicid
