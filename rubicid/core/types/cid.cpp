// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cid.hpp"

#include <algorithm>
#include <iterator>

#include <absl/strings/ascii.h>

#include <rubicid/core/common/base58.hpp>
#include <rubicid/core/common/util.hpp>

namespace rubicid {

std::string digest_to_cidv0(const TokenHash& digest) {
    Bytes multihash;
    multihash.reserve(2 + digest.size());
    multihash.push_back(kSha256MultihashCode);
    multihash.push_back(static_cast<uint8_t>(digest.size()));
    multihash.append(digest.data(), digest.size());
    return encode_base58(multihash);
}

tl::expected<std::string, DecodingError> hex_to_cidv0(std::string_view hex) {
    std::string compact;
    compact.reserve(hex.size());
    std::copy_if(hex.cbegin(), hex.cend(), std::back_inserter(compact),
                 [](char c) { return !absl::ascii_isspace(static_cast<unsigned char>(c)); });

    if (compact.size() == kTokenContentLength) {
        compact.erase(0, kLevelDigits);
    } else if (compact.size() != kHashHexLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    if (!is_hex(compact)) {
        return tl::unexpected{DecodingError::kInvalidHexDigit};
    }
    const auto bytes{from_hex(compact)};
    if (!bytes) {
        return tl::unexpected{DecodingError::kInvalidHexDigit};
    }
    TokenHash digest{};
    std::copy(bytes->cbegin(), bytes->cend(), digest.begin());
    return digest_to_cidv0(digest);
}

tl::expected<TokenHash, DecodingError> cidv0_to_digest(std::string_view cid) {
    if (cid.size() != kCidV0Length) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    const auto multihash{decode_base58(cid)};
    if (!multihash) {
        return tl::unexpected{DecodingError::kInvalidCharacter};
    }
    if (multihash->size() != 2 + kHashLength || (*multihash)[0] != kSha256MultihashCode ||
        (*multihash)[1] != kHashLength) {
        return tl::unexpected{DecodingError::kUnsupportedMultihash};
    }
    TokenHash digest{};
    std::copy(multihash->cbegin() + 2, multihash->cend(), digest.begin());
    return digest;
}

}  // namespace rubicid
