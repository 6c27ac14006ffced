// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace rubicid {

//! Throw std::logic_error when an internal invariant of a build does not hold
template <unsigned int N>
inline void ensure_invariant(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] {
        throw std::logic_error("Invariant violation: " + std::string{message});
    }
}

//! Throw std::invalid_argument when operator input is unusable, the message is built only on failure
//! Usage: `ensure_pre_condition(level > 0, [&] { return "invalid level " + std::to_string(level); });`
inline void ensure_pre_condition(bool condition, const std::function<std::string()>& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + message_builder());
    }
}

}  // namespace rubicid
