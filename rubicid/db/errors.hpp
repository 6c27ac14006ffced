// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace rubicid::db {

//! \brief Failure of a commit or query against a durable store
class PersistenceError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace rubicid::db
