//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#include <caf/default_enum_inspect.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace eui {

/// The ways in which hexadecimal identifier text can be malformed.
enum class parse_errc : uint8_t {
  /// No error.
  none = 0,
  /// The input has neither the bare nor the separated length.
  invalid_length,
  /// A character is neither a hex digit nor a separator.
  invalid_char,
  /// A separator appears outside the pair cadence, or is missing from it.
  invalid_separator_place,
  /// Both `:` and `-` appear in the same input.
  only_one_separator_type_expected,
};

/// @relates parse_errc
auto to_string(parse_errc x) -> std::string;

/// @relates parse_errc
bool from_string(std::string_view str, parse_errc& x);

/// @relates parse_errc
bool from_integer(std::underlying_type_t<parse_errc> value, parse_errc& x);

/// @relates parse_errc
template <class Inspector>
auto inspect(Inspector& f, parse_errc& x) {
  return caf::default_enum_inspect(f, x);
}

/// The outcome of parsing identifier text. A default-constructed value means
/// success; otherwise it carries exactly one failure kind and the offending
/// length or character. Never allocates.
class parse_error {
public:
  /// Constructs the success value.
  constexpr parse_error() noexcept = default;

  static constexpr auto invalid_length(size_t length) noexcept -> parse_error {
    auto result = parse_error{parse_errc::invalid_length};
    result.length_ = length;
    return result;
  }

  static constexpr auto invalid_char(char character) noexcept -> parse_error {
    auto result = parse_error{parse_errc::invalid_char};
    result.character_ = character;
    return result;
  }

  static constexpr auto invalid_separator_place() noexcept -> parse_error {
    return parse_error{parse_errc::invalid_separator_place};
  }

  static constexpr auto only_one_separator_type_expected() noexcept
    -> parse_error {
    return parse_error{parse_errc::only_one_separator_type_expected};
  }

  constexpr auto code() const noexcept -> parse_errc {
    return code_;
  }

  /// The total input length. Meaningful for `parse_errc::invalid_length`.
  constexpr auto length() const noexcept -> size_t {
    return length_;
  }

  /// The offending character. Meaningful for `parse_errc::invalid_char`.
  constexpr auto character() const noexcept -> char {
    return character_;
  }

  /// Returns `true` *iff* this holds an error.
  constexpr explicit operator bool() const noexcept {
    return code_ != parse_errc::none;
  }

  friend constexpr bool
  operator==(const parse_error& lhs, const parse_error& rhs) noexcept
    = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, parse_error& x) {
    auto get_character = [&x] {
      return static_cast<int8_t>(x.character_);
    };
    auto set_character = [&x](int8_t character) {
      x.character_ = static_cast<char>(character);
      return true;
    };
    return f.object(x)
      .pretty_name("eui.parse_error")
      .fields(f.field("code", x.code_), f.field("length", x.length_),
              f.field("character", get_character, set_character));
  }

private:
  constexpr explicit parse_error(parse_errc code) noexcept : code_{code} {
  }

  parse_errc code_ = parse_errc::none;
  size_t length_ = 0;
  char character_ = '\0';
};

} // namespace eui

template <>
struct fmt::formatter<eui::parse_errc> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(eui::parse_errc x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<eui::parse_error> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const eui::parse_error& x, FormatContext& ctx) const {
    switch (x.code()) {
      case eui::parse_errc::none:
        return fmt::format_to(ctx.out(), "no error");
      case eui::parse_errc::invalid_length:
        return fmt::format_to(ctx.out(), "invalid length {}", x.length());
      case eui::parse_errc::invalid_char:
        return fmt::format_to(ctx.out(), "invalid character `{}`",
                              x.character());
      case eui::parse_errc::invalid_separator_place:
        return fmt::format_to(ctx.out(), "separator must be placed after "
                                         "every second character");
      case eui::parse_errc::only_one_separator_type_expected:
        return fmt::format_to(ctx.out(),
                              "only one type of separator should be used");
    }
    return ctx.out();
  }
};
