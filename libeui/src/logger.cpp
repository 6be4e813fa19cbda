//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/logger.hpp"

#include "eui/defaults.hpp"
#include "eui/detail/assert.hpp"
#include "eui/error.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <cctype>
#include <memory>

namespace eui {

caf::expected<caf::detail::scope_guard<void (*)() noexcept>>
create_log_context(const caf::settings& cfg) {
  if (!detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up the logger");
  return {caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return EUI_LOG_LEVEL_QUIET;
  if (x == "critical")
    return EUI_LOG_LEVEL_CRITICAL;
  if (x == "error")
    return EUI_LOG_LEVEL_ERROR;
  if (x == "warning")
    return EUI_LOG_LEVEL_WARNING;
  if (x == "info")
    return EUI_LOG_LEVEL_INFO;
  if (x == "verbose")
    return EUI_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return EUI_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return EUI_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts an eui log level to spdlog level
spdlog::level::level_enum eui_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case EUI_LOG_LEVEL_QUIET:
      break;
    case EUI_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case EUI_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case EUI_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case EUI_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case EUI_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case EUI_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case EUI_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      EUI_ASSERT(false, "unhandled log level");
  }
  return level;
}

auto make_null_logger() -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
    std::string{defaults::logger::null_logger_name},
    std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

namespace detail {

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto instance = make_null_logger();
  return instance;
}

bool setup_spdlog(const caf::settings& cfg) try {
  if (logger()->name() != defaults::logger::null_logger_name) {
    EUI_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = std::string{defaults::logger::console_verbosity};
  if (auto* value = caf::get_if<std::string>(&cfg, "eui.console-verbosity")) {
    if (loglevel_to_int(*value, -1) < 0) {
      fmt::print(stderr,
                 "failed to start logger; eui.console-verbosity '{}' is "
                 "invalid\n",
                 *value);
      return false;
    }
    console_verbosity = *value;
  }
  auto console_format = caf::get_or(cfg, "eui.console-format",
                                    std::string{
                                      defaults::logger::console_format});
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
    spdlog::color_mode::automatic);
  sink->set_pattern(console_format);
  auto console_logger = std::make_shared<spdlog::logger>("eui", sink);
  console_logger->set_level(
    eui_loglevel_to_spd(loglevel_to_int(console_verbosity)));
  console_logger->flush_on(spdlog::level::err);
  logger() = std::move(console_logger);
  EUI_DEBUG("logger started with console verbosity {}", console_verbosity);
  return true;
} catch (const spdlog::spdlog_ex& err) {
  fmt::print(stderr, "failed to start logger: {}\n", err.what());
  return false;
}

void shutdown_spdlog() noexcept {
  EUI_DEBUG("shutting down logger");
  logger()->flush();
  logger() = make_null_logger();
}

} // namespace detail

} // namespace eui
