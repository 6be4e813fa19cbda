//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/detail/hex.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace eui::detail {

/// Renders bytes as lowercase hex digits without separators.
template <size_t N>
constexpr auto format_hex(std::span<const std::byte, N> bytes)
  -> std::array<char, 2 * N> {
  auto result = std::array<char, 2 * N>{};
  auto out = result.begin();
  for (auto x : bytes) {
    auto [hi, lo] = hex::byte_to_chars(x);
    *out++ = hi;
    *out++ = lo;
  }
  return result;
}

/// Renders bytes as lowercase hex digit pairs joined by `separator`.
template <size_t N>
  requires(N > 0)
constexpr auto format_hex(std::span<const std::byte, N> bytes, char separator)
  -> std::array<char, 3 * N - 1> {
  auto result = std::array<char, 3 * N - 1>{};
  auto out = result.begin();
  for (size_t i = 0; i < N; ++i) {
    if (i > 0)
      *out++ = separator;
    auto [hi, lo] = hex::byte_to_chars(bytes[i]);
    *out++ = hi;
    *out++ = lo;
  }
  return result;
}

} // namespace eui::detail
