//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/parse_error.hpp"

#include "eui/detail/assert.hpp"

#include <array>

namespace eui {
namespace {

constexpr auto descriptions = std::array<std::string_view, 5>{
  "none",
  "invalid_length",
  "invalid_char",
  "invalid_separator_place",
  "only_one_separator_type_expected",
};

} // namespace

auto to_string(parse_errc x) -> std::string {
  auto index = static_cast<size_t>(x);
  EUI_ASSERT(index < descriptions.size());
  return std::string{descriptions[index]};
}

bool from_string(std::string_view str, parse_errc& x) {
  for (size_t i = 0; i < descriptions.size(); ++i) {
    if (descriptions[i] == str) {
      x = static_cast<parse_errc>(i);
      return true;
    }
  }
  return false;
}

bool from_integer(std::underlying_type_t<parse_errc> value, parse_errc& x) {
  if (value >= descriptions.size())
    return false;
  x = static_cast<parse_errc>(value);
  return true;
}

} // namespace eui
