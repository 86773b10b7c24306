// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace aurabridge {

inline constexpr std::string_view kColorReset = "\x1b[0m";  // Resets fore color to terminal default

inline constexpr std::string_view kColorCoal = "\x1b[90m";        // Black
inline constexpr std::string_view kColorWhite = "\x1b[97m";       // White
inline constexpr std::string_view kColorRed = "\x1b[91m";         // Red
inline constexpr std::string_view kColorGreen = "\x1b[32m";       // Green
inline constexpr std::string_view kColorOrangeHigh = "\x1b[1;33m";  // Yellow

inline constexpr std::string_view kBackgroundRed = "\x1b[101m";     // Red
inline constexpr std::string_view kBackgroundPurple = "\x1b[105m";  // Purple

//! Check if specified file descriptor is a teletype (TTY) terminal
bool is_terminal(int fd);

//! Check if standard output is a TTY terminal
bool is_terminal_stdout();

//! Check if standard error is a TTY terminal
bool is_terminal_stderr();

}  // namespace aurabridge
