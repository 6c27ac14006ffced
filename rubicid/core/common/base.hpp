// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace rubicid {

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};
inline constexpr uint64_t kGibi{1024 * kMebi};
inline constexpr uint64_t kTebi{1024 * kGibi};

consteval uint64_t operator"" _Kibi(unsigned long long x) { return x * kKibi; }
consteval uint64_t operator"" _Mebi(unsigned long long x) { return x * kMebi; }
consteval uint64_t operator"" _Gibi(unsigned long long x) { return x * kGibi; }
consteval uint64_t operator"" _Tebi(unsigned long long x) { return x * kTebi; }

}  // namespace rubicid
