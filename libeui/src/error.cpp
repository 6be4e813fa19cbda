//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/error.hpp"

#include "eui/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>

#include <array>
#include <sstream>
#include <string>

namespace eui {
namespace {

constexpr auto descriptions = std::array<std::string_view, 8>{
  "no_error",
  "unspecified",
  "invalid_length",
  "invalid_character",
  "invalid_separator_place",
  "mixed_separators",
  "invalid_configuration",
  "serialization_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i))
        oss << ctx.get_as<std::string>(i);
      else
        oss << to_string(ctx);
    }
  }
}

// The input shapes accepted for an identifier of `width` bytes.
auto expecting(size_t width) -> std::string {
  return fmt::format("{} byte string with only hexadecimal characters or {} "
                     "byte string with hexadecimal characters and separator "
                     "after every second character",
                     2 * width, 3 * width - 1);
}

} // namespace

auto to_string(ec x) -> std::string {
  auto index = static_cast<size_t>(x);
  EUI_ASSERT(index < descriptions.size());
  return std::string{descriptions[index]};
}

bool from_string(std::string_view str, ec& x) {
  for (size_t i = 0; i < descriptions.size(); ++i) {
    if (descriptions[i] == str) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

bool from_integer(std::underlying_type_t<ec> value, ec& x) {
  if (value >= descriptions.size())
    return false;
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return "";
  if (err.category() != caf::type_id_v<ec>)
    return caf::to_string(err);
  std::ostringstream oss;
  oss << to_string(static_cast<ec>(err.code()));
  render_default_ctx(oss, err.context());
  return std::move(oss).str();
}

auto to_error(const parse_error& err, size_t width) -> caf::error {
  EUI_ASSERT(err, "cannot convert a successful parse into an error");
  switch (err.code()) {
    case parse_errc::none:
      break;
    case parse_errc::invalid_length:
      return caf::make_error(ec::invalid_length,
                             fmt::format("invalid length {}, expected {}",
                                         err.length(), expecting(width)));
    case parse_errc::invalid_char:
      return caf::make_error(ec::invalid_character,
                             fmt::format("invalid value: character `{}`, "
                                         "expected {}",
                                         err.character(), expecting(width)));
    case parse_errc::invalid_separator_place:
      return caf::make_error(ec::invalid_separator_place,
                             "Separator must be placed after every second "
                             "character");
    case parse_errc::only_one_separator_type_expected:
      return caf::make_error(ec::mixed_separators,
                             "Only one type of separator should be used");
  }
  return {};
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error)
    return error;
  if (error.category() != caf::type_id_v<ec>)
    return caf::make_error(ec::unspecified,
                           fmt::format("{}: {}", str, caf::to_string(error)));
  const auto code = static_cast<ec>(error.code());
  const auto& ctx = error.context();
  if (ctx.match_elements<std::string>())
    return caf::make_error(code,
                           fmt::format("{}: {}", str,
                                       ctx.get_as<std::string>(0)));
  return caf::make_error(code, std::move(str));
}

} // namespace eui
