// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <rubicid/core/common/decoding_result.hpp>
#include <rubicid/core/types/token.hpp>

namespace rubicid {

//! Multihash code of SHA2-256
inline constexpr uint8_t kSha256MultihashCode{0x12};

//! Length in characters of a base58btc CIDv0
inline constexpr size_t kCidV0Length{46};

//! \brief CIDv0 (base58btc of the SHA2-256 multihash) addressing the given digest
std::string digest_to_cidv0(const TokenHash& digest);

//! \brief CIDv0 from a hex digest
//! \details All whitespace is ignored. Accepts either a 64 hex character digest or a 67 character token content,
//! in which case the trailing 64 characters are taken as the digest
tl::expected<std::string, DecodingError> hex_to_cidv0(std::string_view hex);

//! \brief Digest addressed by a CIDv0
tl::expected<TokenHash, DecodingError> cidv0_to_digest(std::string_view cid);

}  // namespace rubicid
