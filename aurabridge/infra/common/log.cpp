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

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace aurabridge::log {

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
static bool is_terminal{false};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings.log_file));
        // Escape sequences must not end up into the log file
        settings_.log_nocolor = true;
    }
    is_terminal = settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

std::string get_thread_name() {
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

    auto [log_level, color] = get_level_settings(level);

    const auto trim = [](std::string_view s) {
        const absl::string_view t{absl::StripAsciiWhitespace(absl::string_view{s.data(), s.size()}).substr(0, 4)};
        return std::string_view{t.data(), t.size()};
    };
    auto log_tag{settings_.log_trim ? trim(log_level) : log_level};
    std::string_view padding = settings_.log_trim ? "" : " ";
    ss_ << kColorReset
        << (settings_.log_trim && !is_terminal ? "[" : padding) << color << log_tag
        << kColorReset
        << (settings_.log_trim && !is_terminal ? "] " : padding);

    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz) << "] " << kColorReset;

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
    bool key{true};
    for (const auto& arg : args) {
        ss_ << (key ? kColorGreen : kColorWhite) << arg << kColorReset << (key ? "=" : " ") << kColorReset;
        key = !key;
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    static const std::regex kColorPattern("(\\\x1b\\[[0-9;]{1,}m)");

    std::string line{ss_.str()};
    const std::string plain_line{std::regex_replace(line, kColorPattern, "")};
    if (settings_.log_nocolor) {
        line = plain_line;
    }
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        *file_ << plain_line << '\n';
    }
}

}  // namespace aurabridge::log
