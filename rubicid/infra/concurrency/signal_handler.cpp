// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "signal_handler.hpp"

#include <array>
#include <csignal>
#include <cstdio>
#include <cstdlib>

namespace rubicid {

//! Interrupting this many times aborts the process without waiting for the pending batch
inline constexpr uint32_t kForcedExitCount{3};

inline constexpr std::array<int, 2> kInterruptSignals{SIGINT, SIGTERM};

std::atomic_uint32_t SignalHandler::sig_count_{0};
std::atomic_bool SignalHandler::signalled_{false};
bool SignalHandler::silent_{false};

using SignalHandlerFunc = void (*)(int);
static std::array<SignalHandlerFunc, kInterruptSignals.size()> previous_handlers{SIG_DFL, SIG_DFL};

static SignalHandlerFunc install(int sig_code, SignalHandlerFunc handler) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigfillset(&action.sa_mask);
    struct sigaction previous {};
    if (::sigaction(sig_code, &action, &previous) == -1) {
        return SIG_ERR;
    }
    return previous.sa_handler;
}

void SignalHandler::init(bool silent) {
    silent_ = silent;
    for (size_t i{0}; i < kInterruptSignals.size(); ++i) {
        const auto previous{install(kInterruptSignals[i], &SignalHandler::handle)};
        if (previous != SIG_ERR && previous != &SignalHandler::handle) {
            previous_handlers[i] = previous;
        }
    }
}

void SignalHandler::handle(int /*sig_code*/) {
    // Only async-signal-safe calls below
    const uint32_t count{++sig_count_};
    signalled_ = true;
    if (count >= kForcedExitCount) {
        std::_Exit(EXIT_FAILURE);
    }
    if (!silent_) {
        (void)std::fputs(count == 1 ? "\nInterrupted, flushing the current batch ...\n"
                                    : "\nStill flushing, interrupt once more to exit immediately\n",
                         stderr);
    }
}

void SignalHandler::reset() {
    signalled_ = false;
    sig_count_ = 0;
    for (size_t i{0}; i < kInterruptSignals.size(); ++i) {
        if (install(kInterruptSignals[i], previous_handlers[i]) == SIG_ERR) {
            (void)std::fputs("Cannot restore previous signal handler\n", stderr);
        }
    }
}

}  // namespace rubicid
