//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <source_location>
#include <string>
#include <string_view>

namespace eui::detail {

/// Logs the message and throws a `std::runtime_error`.
[[noreturn]] void panic_impl(std::string message, std::source_location source);

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source
                    = std::source_location::current());

[[noreturn]] inline void
fail_assertion_impl(const char* expr, std::source_location source
                                      = std::source_location::current()) {
  fail_assertion_impl(expr, std::string_view{}, source);
}

} // namespace eui::detail

/// Checks a precondition that holds unless there is a bug in the caller.
/// Accepts an optional explanation as second argument.
#define EUI_ASSERT(expr, ...)                                                  \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::eui::detail::fail_assertion_impl(#expr __VA_OPT__(, ) __VA_ARGS__);    \
    }                                                                          \
  } while (false)
