//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/detail/assert.hpp"
#include "eui/parse_error.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace eui::detail::hex {

/// The alphabet for rendering nibbles.
inline constexpr std::string_view lowercase_alphabet = "0123456789abcdef";

/// Checks whether a character is a hex digit in either case.
constexpr auto is_digit(char c) noexcept -> bool {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')
         || (c >= 'A' && c <= 'F');
}

/// Renders a nibble as lowercase hex digit.
/// @pre `nibble < 16`
constexpr auto nibble_to_char(uint8_t nibble) -> char {
  EUI_ASSERT(nibble < 16);
  return lowercase_alphabet[nibble];
}

/// Decodes a hex digit of either case into its nibble.
/// @returns `parse_errc::invalid_char` for anything but a hex digit.
constexpr auto char_to_nibble(char c, uint8_t& nibble) noexcept
  -> parse_error {
  if (c >= '0' && c <= '9')
    nibble = static_cast<uint8_t>(c - '0');
  else if (c >= 'a' && c <= 'f')
    nibble = static_cast<uint8_t>(c - 'a' + 10);
  else if (c >= 'A' && c <= 'F')
    nibble = static_cast<uint8_t>(c - 'A' + 10);
  else
    return parse_error::invalid_char(c);
  return {};
}

/// Renders a byte as two lowercase hex digits, high nibble first.
constexpr auto byte_to_chars(std::byte x) -> std::pair<char, char> {
  const auto value = std::to_integer<uint8_t>(x);
  return {nibble_to_char(value >> 4), nibble_to_char(value & 0x0f)};
}

} // namespace eui::detail::hex
