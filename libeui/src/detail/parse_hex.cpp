//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/parse_hex.hpp"

#include "eui/detail/assert.hpp"
#include "eui/detail/hex.hpp"

#include <cstdint>

namespace eui::detail {

namespace {

// Tracks the one separator kind an input may use.
class separator_tracker {
public:
  auto observe(char c) noexcept -> parse_error {
    if (kind_ == '\0')
      kind_ = c;
    else if (c != kind_)
      return parse_error::only_one_separator_type_expected();
    return {};
  }

private:
  char kind_ = '\0';
};

} // namespace

auto parse_hex(std::string_view input, std::span<std::byte> output)
  -> parse_error {
  EUI_ASSERT(not output.empty());
  const auto n = output.size();
  const auto bare_length = 2 * n;
  const auto separated_length = 3 * n - 1;
  if (input.size() != bare_length && input.size() != separated_length)
    return parse_error::invalid_length(input.size());
  // The character after the first pair selects the format. Text of the
  // separated length without a separator there is bare text with leftovers.
  const auto separated = n > 1 && input.size() == separated_length
                         && is_separator(input[2]);
  auto separators = separator_tracker{};
  // Decodes a position that must hold a hex digit.
  auto digit = [&](char c, uint8_t& nibble) -> parse_error {
    if (is_separator(c)) {
      if (auto err = separators.observe(c))
        return err;
      return parse_error::invalid_separator_place();
    }
    return hex::char_to_nibble(c, nibble);
  };
  auto pos = size_t{0};
  for (size_t i = 0; i < n; ++i) {
    if (separated && i > 0) {
      const auto c = input[pos++];
      if (not is_separator(c)) {
        if (hex::is_digit(c))
          return parse_error::invalid_separator_place();
        return parse_error::invalid_char(c);
      }
      if (auto err = separators.observe(c))
        return err;
    }
    auto hi = uint8_t{0};
    if (auto err = digit(input[pos++], hi))
      return err;
    auto lo = uint8_t{0};
    if (auto err = digit(input[pos++], lo))
      return err;
    output[i] = static_cast<std::byte>((hi << 4) | lo);
  }
  if (pos != input.size())
    return parse_error::invalid_length(input.size());
  return {};
}

} // namespace eui::detail
