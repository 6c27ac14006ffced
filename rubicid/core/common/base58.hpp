// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <rubicid/core/common/bytes.hpp>

namespace rubicid {

//! \brief Encode bytes using the Bitcoin base58 alphabet (leading zero bytes become '1')
std::string encode_base58(ByteView data);

//! \brief Decode a Bitcoin base58 string
//! \return std::nullopt if any character is outside the alphabet
std::optional<Bytes> decode_base58(std::string_view encoded);

}  // namespace rubicid
