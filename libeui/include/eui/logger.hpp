//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#include "eui/detail/discard.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <memory>
#include <string>

// EUI_INFO -> spdlog::info
// EUI_VERBOSE -> spdlog::debug
// EUI_DEBUG -> spdlog::trace
// EUI_TRACE -> spdlog::trace

#if EUI_LOG_LEVEL == EUI_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif EUI_LOG_LEVEL == EUI_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include <spdlog/spdlog.h>

namespace eui::detail {

/// Returns the library logger. Until `create_log_context` runs, this is a
/// logger without sinks.
auto logger() -> std::shared_ptr<spdlog::logger>&;

bool setup_spdlog(const caf::settings& cfg);

void shutdown_spdlog() noexcept;

} // namespace eui::detail

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_TRACE

#  define EUI_TRACE(...)                                                       \
    SPDLOG_LOGGER_TRACE(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_TRACE

#  define EUI_TRACE(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_TRACE

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_DEBUG

#  define EUI_DEBUG(...)                                                       \
    SPDLOG_LOGGER_TRACE(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_DEBUG

#  define EUI_DEBUG(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_DEBUG

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_VERBOSE

#  define EUI_VERBOSE(...)                                                     \
    SPDLOG_LOGGER_DEBUG(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_VERBOSE

#  define EUI_VERBOSE(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_VERBOSE

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_INFO

#  define EUI_INFO(...) SPDLOG_LOGGER_INFO(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_INFO

#  define EUI_INFO(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_INFO

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_WARNING

#  define EUI_WARN(...) SPDLOG_LOGGER_WARN(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_WARNING

#  define EUI_WARN(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_WARNING

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_ERROR

#  define EUI_ERROR(...)                                                       \
    SPDLOG_LOGGER_ERROR(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_ERROR

#  define EUI_ERROR(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_ERROR

#if EUI_LOG_LEVEL >= EUI_LOG_LEVEL_CRITICAL

#  define EUI_CRITICAL(...)                                                    \
    SPDLOG_LOGGER_CRITICAL(::eui::detail::logger(), __VA_ARGS__)

#else // EUI_LOG_LEVEL < EUI_LOG_LEVEL_CRITICAL

#  define EUI_CRITICAL(...) EUI_DISCARD_ARGS(__VA_ARGS__)

#endif // EUI_LOG_LEVEL < EUI_LOG_LEVEL_CRITICAL

namespace eui {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string x, int default_value = EUI_LOG_LEVEL_QUIET);

/// Installs the console logger configured by `eui.console-verbosity` and
/// `eui.console-format`. The returned guard restores the null logger.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)() noexcept>>
create_log_context(const caf::settings& cfg);

} // namespace eui
