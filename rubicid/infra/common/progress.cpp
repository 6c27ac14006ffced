// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "progress.hpp"

#include <iomanip>
#include <sstream>

namespace rubicid {

using namespace std::chrono_literals;

double ProgressMeter::rate() const {
    const auto seconds{std::chrono::duration<double>(elapsed()).count()};
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(done()) / seconds;
}

ProgressMeter::Duration ProgressMeter::eta() const {
    const auto current_rate{rate()};
    const auto completed{done()};
    if (current_rate <= 0.0 || completed >= total_) {
        return Duration{0};
    }
    const auto remaining_seconds{static_cast<double>(total_ - completed) / current_rate};
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(remaining_seconds));
}

bool ProgressMeter::report_due() {
    const auto now{Clock::now()};
    if (now - last_report_ < report_interval_) {
        return false;
    }
    last_report_ = now;
    return true;
}

log::Args ProgressMeter::as_log_args() const {
    const auto completed{done()};
    std::ostringstream percent;
    percent << std::fixed << std::setprecision(2)
            << (total_ ? 100.0 * static_cast<double>(completed) / static_cast<double>(total_) : 100.0) << "%";
    std::ostringstream speed;
    speed << std::fixed << std::setprecision(0) << rate() << "/s";
    return {
        "done", std::to_string(completed),
        "total", std::to_string(total_),
        "progress", percent.str(),
        "rate", speed.str(),
        "eta", format(eta()),
    };
}

std::string ProgressMeter::format(Duration duration) {
    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

    std::ostringstream os;
    if (duration >= 60s) {
        bool need_space{false};
        if (const auto d = std::chrono::duration_cast<Days>(duration); d.count()) {
            os << d.count() << "d";
            duration -= d;
            need_space = true;
        }
        if (const auto h = std::chrono::duration_cast<std::chrono::hours>(duration); h.count()) {
            os << (need_space ? " " : "") << h.count() << "h";
            duration -= h;
            need_space = true;
        }
        if (const auto m = std::chrono::duration_cast<std::chrono::minutes>(duration); m.count()) {
            os << (need_space ? " " : "") << m.count() << "m";
            duration -= m;
            need_space = true;
        }
        if (const auto s = std::chrono::duration_cast<std::chrono::seconds>(duration); s.count()) {
            os << (need_space ? " " : "") << s.count() << "s";
        }
        return os.str();
    }
    const auto ms{std::chrono::duration_cast<std::chrono::milliseconds>(duration)};
    os << ms.count() / 1000 << "." << std::setw(3) << std::setfill('0') << ms.count() % 1000 << "s";
    return os.str();
}

}  // namespace rubicid
