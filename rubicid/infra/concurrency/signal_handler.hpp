// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>

namespace rubicid {

//! \brief Process-wide interruption flag raised by SIGINT/SIGTERM, polled by long running builds
class SignalHandler {
  public:
    //! Install the handler on SIGINT and SIGTERM, the previous handlers are saved
    static void init(bool silent = false);

    static void handle(int sig_code);

    static bool signalled() { return signalled_; }

    //! Clear the flag and restore the previous handlers
    static void reset();

  private:
    static std::atomic_uint32_t sig_count_;
    static std::atomic_bool signalled_;
    static bool silent_;
};

}  // namespace rubicid
