// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace rubicid::log {

//! The fixed size for thread name in log traces
static constexpr size_t kThreadNameFixedSize = 11;

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
thread_local std::string thread_name_{};

static void open_log_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Cannot open log file " + path.string());
    }
}

void init(const Settings& settings) {
    settings_ = settings;
    if (settings_.log_file.empty()) {
        file_.reset();
    } else {
        open_log_file(settings_.log_file);
    }
    const bool is_tty{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    settings_.log_nocolor = settings_.log_nocolor || !is_tty;
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = std::string(name);
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

static const std::string& thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static std::pair<std::string_view, std::string_view> get_level_settings(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"     ", kColorReset};
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    const auto [log_tag, color] = get_level_settings(level);
    ss_ << kColorReset << " " << color << log_tag << kColorReset << " ";

    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%Y-%m-%d %H:%M:%E3S", absl::Now(), tz) << "] " << kColorReset;

    if (settings_.log_threads) {
        ss_ << "[" << thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    static const std::regex kColorPattern("(\\\x1b\\[[0-9;]{1,}m)");

    std::string line{ss_.str()};
    const bool colorized{!settings_.log_nocolor};
    if (!colorized) {
        line = std::regex_replace(line, kColorPattern, "");
    }
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        if (colorized) {
            line = std::regex_replace(line, kColorPattern, "");
        }
        *file_ << line << '\n';
    }
}

}  // namespace rubicid::log
