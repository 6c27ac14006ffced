// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <rubicid/infra/common/log.hpp>

namespace rubicid {

//! \brief Throughput tracker for long-running builds: counts completed items and reports rate and ETA
//! \remarks add() is safe to call from many threads, reporting is expected from a single one
class ProgressMeter {
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    explicit ProgressMeter(uint64_t total, std::chrono::milliseconds report_interval = std::chrono::seconds{5})
        : total_{total}, report_interval_{report_interval} {}

    void add(uint64_t count = 1) noexcept { done_.fetch_add(count, std::memory_order_relaxed); }

    uint64_t done() const noexcept { return done_.load(std::memory_order_relaxed); }
    uint64_t total() const noexcept { return total_; }

    //! \brief Items per second since start
    double rate() const;

    //! \brief Estimated time to completion at the current rate
    Duration eta() const;

    Duration elapsed() const { return Clock::now() - start_; }

    //! \brief Whether a new report is due; consumes the reporting slot when it is
    bool report_due();

    //! \brief Key/value pairs suitable for structured logging
    log::Args as_log_args() const;

    //! \brief Returns a human readable duration, e.g. "1h 2m 3s" or "1.500s"
    static std::string format(Duration duration);

  private:
    uint64_t total_;
    std::chrono::milliseconds report_interval_;
    std::atomic_uint64_t done_{0};
    Clock::time_point start_{Clock::now()};
    Clock::time_point last_report_{start_};
};

}  // namespace rubicid
