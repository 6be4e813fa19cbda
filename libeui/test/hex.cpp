//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/hex.hpp"

#include "eui/test/test.hpp"

#include <cstdint>

using namespace eui;
using namespace eui::detail;

TEST("hex digit classification") {
  for (auto c : std::string_view{"0123456789abcdefABCDEF"})
    CHECK(hex::is_digit(c));
  for (auto c : std::string_view{"gGzZ:- x\t/@`"})
    CHECK(! hex::is_digit(c));
}

TEST("nibble to character") {
  CHECK_EQUAL(hex::nibble_to_char(0), '0');
  CHECK_EQUAL(hex::nibble_to_char(9), '9');
  CHECK_EQUAL(hex::nibble_to_char(10), 'a');
  CHECK_EQUAL(hex::nibble_to_char(15), 'f');
}

TEST("character to nibble") {
  auto nibble = uint8_t{0xff};
  CHECK(! hex::char_to_nibble('0', nibble));
  CHECK_EQUAL(nibble, 0u);
  CHECK(! hex::char_to_nibble('7', nibble));
  CHECK_EQUAL(nibble, 7u);
  CHECK(! hex::char_to_nibble('b', nibble));
  CHECK_EQUAL(nibble, 11u);
  CHECK(! hex::char_to_nibble('B', nibble));
  CHECK_EQUAL(nibble, 11u);
  CHECK(! hex::char_to_nibble('F', nibble));
  CHECK_EQUAL(nibble, 15u);
}

TEST("separators are not hex digits") {
  auto nibble = uint8_t{0};
  CHECK_EQUAL(hex::char_to_nibble(':', nibble), parse_error::invalid_char(':'));
  CHECK_EQUAL(hex::char_to_nibble('-', nibble), parse_error::invalid_char('-'));
  CHECK_EQUAL(hex::char_to_nibble('g', nibble), parse_error::invalid_char('g'));
}

TEST("byte to characters") {
  CHECK(hex::byte_to_chars(std::byte{0x00}) == std::pair{'0', '0'});
  CHECK(hex::byte_to_chars(std::byte{0x4d}) == std::pair{'4', 'd'});
  CHECK(hex::byte_to_chars(std::byte{0xef}) == std::pair{'e', 'f'});
  CHECK(hex::byte_to_chars(std::byte{0xff}) == std::pair{'f', 'f'});
}
