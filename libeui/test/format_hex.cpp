//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/format_hex.hpp"

#include "eui/test/test.hpp"

#include <array>
#include <string_view>

using namespace eui;

namespace {

template <size_t N>
auto view(const std::array<char, N>& xs) -> std::string_view {
  return {xs.data(), xs.size()};
}

constexpr auto bytes = std::array<std::byte, 6>{
  std::byte{0x4d}, std::byte{0x7e}, std::byte{0x54},
  std::byte{0x97}, std::byte{0x2e}, std::byte{0xef},
};

} // namespace

TEST("bare") {
  auto text = detail::format_hex(std::span<const std::byte, 6>{bytes});
  CHECK_EQUAL(view(text), "4d7e54972eef");
}

TEST("separated") {
  auto colons = detail::format_hex(std::span<const std::byte, 6>{bytes}, ':');
  CHECK_EQUAL(view(colons), "4d:7e:54:97:2e:ef");
  auto hyphens = detail::format_hex(std::span<const std::byte, 6>{bytes}, '-');
  CHECK_EQUAL(view(hyphens), "4d-7e-54-97-2e-ef");
}

TEST("compile-time rendering") {
  constexpr auto text
    = detail::format_hex(std::span<const std::byte, 6>{bytes});
  static_assert(text[0] == '4' && text[11] == 'f');
  CHECK_EQUAL(text.size(), 12u);
}
