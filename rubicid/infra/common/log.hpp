// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <rubicid/infra/common/terminal.hpp>

namespace rubicid::log {

//! \brief Severity of a log line, lower values are more severe
enum class Level {
    kNone,  // Unconditional banner lines
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace
};

//! \brief Logging options shared by every tool, filled from the command line
struct Settings {
    //! Console lines go to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Timestamps in UTC instead of the local timezone
    bool log_utc{true};
    bool log_nocolor{false};
    //! Prefix each line with the thread name
    bool log_threads{false};
    Level log_verbosity{Level::kInfo};
    //! Optional file receiving a copy of every printed line, always without colors
    std::string log_file;
};

//! \brief Apply the settings, to be called once at process start before any worker thread exists
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! \brief Name the calling thread in log lines, padded to a fixed width
void set_thread_name(const char* name);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! Alternating key/value pairs appended to a log line
using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
        bool is_key{true};
        for (const auto& arg : args) {
            ss_ << (is_key ? kColorGreen : kColorWhite) << arg << kColorReset << (is_key ? "=" : " ");
            is_key = !is_key;
        }
    }
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;

}  // namespace rubicid::log

#define RCID_LOGBUFFER(level_, ...)              \
    if (!rubicid::log::test_verbosity(level_)) { \
    } else                                       \
        rubicid::log::LogBuffer<level_>(__VA_ARGS__)

#define RCID_TRACE RCID_LOGBUFFER(rubicid::log::Level::kTrace)
#define RCID_DEBUG RCID_LOGBUFFER(rubicid::log::Level::kDebug)
#define RCID_INFO RCID_LOGBUFFER(rubicid::log::Level::kInfo)
#define RCID_WARN RCID_LOGBUFFER(rubicid::log::Level::kWarning)
#define RCID_ERROR RCID_LOGBUFFER(rubicid::log::Level::kError)
#define RCID_CRIT RCID_LOGBUFFER(rubicid::log::Level::kCritical)
#define RCID_LOG RCID_LOGBUFFER(rubicid::log::Level::kNone)
