//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/parse_hex.hpp"

#include "eui/test/test.hpp"

#include <array>
#include <cstddef>
#include <string_view>

using namespace eui;
using namespace std::string_view_literals;

namespace {

template <size_t N>
auto parse(std::string_view str) -> parse_error {
  auto output = std::array<std::byte, N>{};
  return detail::parse_hex(str, output);
}

constexpr auto expected48 = std::array<std::byte, 6>{
  std::byte{0x4d}, std::byte{0x7e}, std::byte{0x54},
  std::byte{0x97}, std::byte{0x2e}, std::byte{0xef},
};

} // namespace

TEST("separator characters") {
  CHECK(detail::is_separator(':'));
  CHECK(detail::is_separator('-'));
  CHECK(! detail::is_separator('.'));
  CHECK(! detail::is_separator(' '));
  CHECK(! detail::is_separator('_'));
}

TEST("bare input") {
  auto output = std::array<std::byte, 6>{};
  CHECK(! detail::parse_hex("4d7e54972eef", output));
  CHECK(output == expected48);
  CHECK(! detail::parse_hex("4D7E54972EEF", output));
  CHECK(output == expected48);
  CHECK(! detail::parse_hex("4D7e54972EeF", output));
  CHECK(output == expected48);
}

TEST("separated input") {
  for (auto str : {"4d:7e:54:97:2e:ef"sv, "4d-7e-54-97-2e-ef"sv,
                   "4D:7E:54:97:2E:EF"sv, "4D-7E-54-97-2E-EF"sv}) {
    auto output = std::array<std::byte, 6>{};
    CHECK(! detail::parse_hex(str, output));
    CHECK(output == expected48);
  }
}

TEST("eight bytes") {
  auto output = std::array<std::byte, 8>{};
  CHECK(! detail::parse_hex("4d:7e:54:00:00:97:2e:ef", output));
  CHECK(output[0] == std::byte{0x4d});
  CHECK(output[3] == std::byte{0x00});
  CHECK(output[4] == std::byte{0x00});
  CHECK(output[7] == std::byte{0xef});
}

TEST("length is checked first") {
  CHECK_EQUAL(parse<6>(""), parse_error::invalid_length(0));
  CHECK_EQUAL(parse<6>("4d7e54972e"), parse_error::invalid_length(10));
  CHECK_EQUAL(parse<6>("4d7e54972eefef4d"), parse_error::invalid_length(16));
  CHECK_EQUAL(parse<6>("zz:zz:zz:zz"), parse_error::invalid_length(11));
  CHECK_EQUAL(parse<8>("4d7e54972eaa"), parse_error::invalid_length(12));
  CHECK_EQUAL(parse<8>("4d7e54972eefef4ddd"), parse_error::invalid_length(18));
}

TEST("leftover bare input") {
  CHECK_EQUAL(parse<6>("4d7e54972eefef4da"), parse_error::invalid_length(17));
  CHECK_EQUAL(parse<8>("4d7e540000972eef4d7e540"),
              parse_error::invalid_length(23));
}

TEST("invalid characters") {
  CHECK_EQUAL(parse<6>("ad7e54972esa"), parse_error::invalid_char('s'));
  CHECK_EQUAL(parse<8>("ad7e54972ea721sa"), parse_error::invalid_char('s'));
  CHECK_EQUAL(parse<6>("4d:7e:5x:97:2e:ef"), parse_error::invalid_char('x'));
  CHECK_EQUAL(parse<6>("4d:7e:54.97:2e:ef"), parse_error::invalid_char('.'));
  CHECK_EQUAL(parse<6>("4d7e 4972eef"), parse_error::invalid_char(' '));
}

TEST("misplaced separators") {
  const auto misplaced = parse_error::invalid_separator_place();
  CHECK_EQUAL(parse<6>(":4d7e:54:97:2e:ef"), misplaced);
  CHECK_EQUAL(parse<6>("4d:7e:54:97:2eef:"), misplaced);
  CHECK_EQUAL(parse<6>("4d::7e54:97:2e:ef"), misplaced);
  CHECK_EQUAL(parse<6>("4d7e:54:97:2e:ef:"), misplaced);
  CHECK_EQUAL(parse<8>(":4d7e:54:00:00:97:2e:ef"), misplaced);
  CHECK_EQUAL(parse<8>("4d:7e:54:00:00:97:2eef:"), misplaced);
  CHECK_EQUAL(parse<8>("4d::7e54:00:00:97:2e:ef"), misplaced);
}

TEST("mixed separators") {
  const auto mixed = parse_error::only_one_separator_type_expected();
  CHECK_EQUAL(parse<6>("4d:7e:54-97:2e:ef"), mixed);
  CHECK_EQUAL(parse<6>("4d-7e-54-97-2e:ef"), mixed);
  CHECK_EQUAL(parse<8>("4d:7e-54:00:00:97:2e-ef"), mixed);
  // A separator of the other kind inside a pair still reports the mix.
  CHECK_EQUAL(parse<6>("4d:7e:5-:97:2e:ef"), mixed);
}

TEST("the first offending position wins") {
  CHECK_EQUAL(parse<6>("4d:7e:5x-97:2e:ef"), parse_error::invalid_char('x'));
  CHECK_EQUAL(parse<6>("4d:7e-54:97:2e:zz"),
              parse_error::only_one_separator_type_expected());
  CHECK_EQUAL(parse<6>("xd7e54972e:f"), parse_error::invalid_char('x'));
}
