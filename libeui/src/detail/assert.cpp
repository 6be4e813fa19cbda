//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/assert.hpp"

#include "eui/config.hpp"
#include "eui/logger.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace eui::detail {

void panic_impl(std::string message, std::source_location source) {
  EUI_ERROR("panic: {}", message);
  EUI_ERROR("version: {}", EUI_VERSION);
  EUI_ERROR("source: {}:{}", source.file_name(), source.line());
  EUI_ERROR("this is a bug, we would appreciate a report - thank you!");
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

void fail_assertion_impl(const char* expr, std::string_view explanation,
                         std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace eui::detail
