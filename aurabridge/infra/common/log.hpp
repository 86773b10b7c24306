// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <aurabridge/infra/common/terminal.hpp>

namespace aurabridge::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to trim log level
    bool log_trim{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Returns the name printed for the calling thread, i.e. its id
std::string get_thread_name();

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Alternating keys and values printed after the message
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
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args);
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

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace aurabridge::log

#define AURA_LOGBUFFER(level_, ...)                 \
    if (!aurabridge::log::test_verbosity(level_)) { \
    } else                                          \
        aurabridge::log::LogBuffer<level_>(__VA_ARGS__)

#define AURA_TRACE_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kTrace, __VA_ARGS__)
#define AURA_DEBUG_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kDebug, __VA_ARGS__)
#define AURA_INFO_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kInfo, __VA_ARGS__)
#define AURA_WARN_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kWarning, __VA_ARGS__)
#define AURA_ERROR_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kError, __VA_ARGS__)
#define AURA_CRIT_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kCritical, __VA_ARGS__)
#define AURA_LOG_M(...) AURA_LOGBUFFER(aurabridge::log::Level::kNone, __VA_ARGS__)

#define AURA_TRACE AURA_TRACE_M()
#define AURA_DEBUG AURA_DEBUG_M()
#define AURA_INFO AURA_INFO_M()
#define AURA_WARN AURA_WARN_M()
#define AURA_ERROR AURA_ERROR_M()
#define AURA_CRIT AURA_CRIT_M()
#define AURA_LOG AURA_LOG_M()
