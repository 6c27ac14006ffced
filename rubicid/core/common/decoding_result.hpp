// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace rubicid {

// Error codes for token content and identifier decoding
enum class [[nodiscard]] DecodingError {
    kUnexpectedLength,
    kInvalidLevel,
    kInvalidHexDigit,
    kInvalidCharacter,
    kUnsupportedMultihash,
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace rubicid
