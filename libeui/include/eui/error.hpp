//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#include "eui/parse_error.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>

namespace eui {

/// The error codes of libeui.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// Identifier text has neither the bare nor the separated length.
  invalid_length,
  /// Identifier text contains a character that is not a hex digit.
  invalid_character,
  /// A separator is not placed after every second character.
  invalid_separator_place,
  /// Identifier text mixes `:` and `-`.
  mixed_separators,
  /// A configuration value has the wrong type or is out of range.
  invalid_configuration,
  /// An error during serialization.
  serialization_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> std::string;

/// @relates ec
bool from_string(std::string_view str, ec& x);

/// @relates ec
bool from_integer(std::underlying_type_t<ec> value, ec& x);

/// @relates ec
template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

/// Translates a parse failure for an identifier of `width` bytes into an
/// error with a diagnostic that names the accepted input shapes.
/// @pre `err` holds an error.
auto to_error(const parse_error& err, size_t width) -> caf::error;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

} // namespace eui

CAF_ERROR_CODE_ENUM(eui::ec)

template <>
struct fmt::formatter<eui::ec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(eui::ec x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};
