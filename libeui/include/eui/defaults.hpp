//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <string_view>

namespace eui::defaults {

// -- logger -------------------------------------------------------------------

namespace logger {

/// Verbosity of the console sink when `eui.console-verbosity` is unset.
inline constexpr std::string_view console_verbosity = "info";

/// Pattern of the console sink when `eui.console-format` is unset.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

/// Name of the logger that replaces the console logger on shutdown.
inline constexpr std::string_view null_logger_name = "/dev/null";

} // namespace logger

} // namespace eui::defaults
