//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/parse_error.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace eui::detail {

/// Checks whether a character separates the byte pairs of identifier text.
constexpr auto is_separator(char c) noexcept -> bool {
  return c == ':' || c == '-';
}

/// Decodes identifier text into `output` in a single pass.
///
/// The input must either consist of `2 * N` hex digits, or of `N` pairs of
/// hex digits joined by `N - 1` separators of one kind (`:` or `-`), where
/// `N = output.size()`. Hex digits may have either case.
///
/// The length is checked before any character. After that, the first
/// offending position determines the error. A separator compares against the
/// first separator seen before its placement is checked, so that mixing `:`
/// and `-` always reports `parse_errc::only_one_separator_type_expected` once
/// a kind is established.
///
/// @param input The text to decode.
/// @param output The destination bytes. Only complete on success.
/// @returns A default-constructed `parse_error` on success.
/// @pre `not output.empty()`
/// Decodes `output.size()` bytes from hex text in a single pass. The text
/// holds either bare pairs of hex digits or pairs joined by one kind of
/// separator.
/// @param input The text to decode.
/// @param output The destination, with contents unspecified on failure.
/// @returns The first failure in input order, or the success value.
[[nodiscard]] auto parse_hex(std::string_view input, std::span<std::byte> output)
  -> parse_error;

} // namespace eui::detail
