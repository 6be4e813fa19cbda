//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#include "eui/detail/format_hex.hpp"
#include "eui/detail/parse_hex.hpp"
#include "eui/error.hpp"
#include "eui/hash/hash.hpp"
#include "eui/hash/uniquely_represented.hpp"
#include "eui/parse_error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace eui {

/// An *Extended Unique Identifier* of `Width` bytes in network byte order.
/// EUI-48 is structurally a MAC address.
template <size_t Width>
class basic_eui {
  static_assert(Width == 6 || Width == 8, "an EUI has either 6 or 8 bytes");

public:
  /// The number of bytes in the identifier.
  static constexpr size_t num_bytes = Width;

  using byte_type = std::byte;
  using byte_array = std::array<byte_type, Width>;

  /// The canonical text form: lowercase hex digits without separators.
  using text_type = std::array<char, 2 * Width>;

  /// Default-constructs the all-zero identifier.
  constexpr basic_eui() noexcept : bytes_{} {
  }

  /// Constructs an identifier from bytes in network byte order.
  constexpr explicit basic_eui(byte_array bytes) noexcept : bytes_{bytes} {
  }

  /// Constructs an identifier from the low `8 * Width` bits of `value`, the
  /// most significant byte first.
  constexpr explicit basic_eui(uint64_t value) noexcept : bytes_{} {
    for (size_t i = 0; i < Width; ++i)
      bytes_[i]
        = static_cast<std::byte>((value >> (8 * (Width - 1 - i))) & 0xff);
  }

  /// Widens an EUI-48 into an EUI-64 by inserting two zero bytes between the
  /// first and the last three bytes.
  template <size_t OtherWidth>
    requires(Width == 8 && OtherWidth == 6)
  constexpr explicit basic_eui(const basic_eui<OtherWidth>& other) noexcept
    : bytes_{} {
    const auto src = as_bytes(other);
    std::copy(src.begin(), src.begin() + 3, bytes_.begin());
    bytes_[3] = std::byte{0x00};
    bytes_[4] = std::byte{0x00};
    std::copy(src.begin() + 3, src.end(), bytes_.begin() + 5);
  }

  /// Parses identifier text of `2 * Width` hex digits, or of `Width` pairs
  /// of hex digits joined by `:` or `-`.
  /// @param str The text to parse.
  /// @param x The result, only assigned on success.
  /// @returns A default-constructed `parse_error` on success.
  [[nodiscard]] static auto parse(std::string_view str, basic_eui& x)
    -> parse_error {
    auto bytes = byte_array{};
    if (auto err = detail::parse_hex(str, bytes))
      return err;
    x = basic_eui{bytes};
    return {};
  }

  /// Returns the identifier as integer, zero-extended for EUI-48.
  constexpr auto to_u64() const noexcept -> uint64_t {
    auto result = uint64_t{0};
    for (auto x : bytes_)
      result = (result << 8) | std::to_integer<uint64_t>(x);
    return result;
  }

  /// Renders the canonical text form.
  constexpr auto to_chars() const -> text_type {
    return detail::format_hex(as_bytes(*this));
  }

  /// Returns the *Organizationally Unique Identifier (OUI)*.
  constexpr auto oui() const noexcept -> std::span<const std::byte, 3> {
    return as_bytes(*this).template first<3>();
  }

  /// Returns `true` *iff* the identifier is universally administered.
  constexpr auto is_universal() const noexcept -> bool {
    constexpr auto mask = std::byte{0b00000010};
    return (bytes_[0] & mask) == std::byte{0};
  }

  /// Returns `true` *iff* the identifier addresses a single station.
  constexpr auto is_unicast() const noexcept -> bool {
    constexpr auto mask = std::byte{0b00000001};
    return (bytes_[0] & mask) == std::byte{0};
  }

  friend constexpr auto as_bytes(const basic_eui& x) noexcept
    -> std::span<const std::byte, Width> {
    return std::span<const std::byte, Width>{x.bytes_};
  }

  friend constexpr bool
  operator==(const basic_eui& lhs, const basic_eui& rhs) noexcept
    = default;

  friend constexpr auto
  operator<=>(const basic_eui& lhs, const basic_eui& rhs) noexcept
    = default;

  /// Human-readable formats see the canonical text and accept every text
  /// form that `parse` accepts; binary formats see the raw bytes.
  template <class Inspector>
  friend auto inspect(Inspector& f, basic_eui& x) -> bool {
    if (f.has_human_readable_format()) {
      if constexpr (Inspector::is_loading) {
        auto str = std::string{};
        if (not f.apply(str))
          return false;
        if (auto err = parse(str, x)) {
          f.set_error(to_error(err, Width));
          return false;
        }
        return true;
      } else {
        const auto text = x.to_chars();
        auto str = std::string{text.begin(), text.end()};
        return f.apply(str);
      }
    }
    return f.apply(x.bytes_);
  }

private:
  byte_array bytes_;
};

/// Widens an EUI-48 into an EUI-64.
/// @relates basic_eui
constexpr auto widen(const eui48& x) noexcept -> eui64 {
  return eui64{x};
}

/// @relates basic_eui
template <size_t Width>
auto to_string(const basic_eui<Width>& x) -> std::string {
  const auto text = x.to_chars();
  return std::string{text.begin(), text.end()};
}

template <size_t Width>
struct is_uniquely_represented<basic_eui<Width>>
  : std::bool_constant<sizeof(basic_eui<Width>) == Width> {};

extern template class basic_eui<6>;
extern template class basic_eui<8>;

} // namespace eui

/// Renders the canonical form by default. The presentation types `c` and `h`
/// join the byte pairs with `:` and `-`, respectively.
template <size_t Width>
struct fmt::formatter<eui::basic_eui<Width>> {
  char separator = '\0';

  constexpr auto parse(format_parse_context& ctx) {
    auto it = ctx.begin();
    auto end = ctx.end();
    if (it != end && *it != '}') {
      if (*it == 'c')
        separator = ':';
      else if (*it == 'h')
        separator = '-';
      else
        throw format_error("invalid presentation type for EUI");
      ++it;
    }
    if (it != end && *it != '}')
      throw format_error("invalid format specification for EUI");
    return it;
  }

  template <class FormatContext>
  auto format(const eui::basic_eui<Width>& x, FormatContext& ctx) const {
    if (separator == '\0') {
      const auto text = x.to_chars();
      return std::copy(text.begin(), text.end(), ctx.out());
    }
    const auto text = eui::detail::format_hex(as_bytes(x), separator);
    return std::copy(text.begin(), text.end(), ctx.out());
  }
};

namespace std {

template <size_t Width>
struct hash<eui::basic_eui<Width>> {
  auto operator()(const eui::basic_eui<Width>& x) const noexcept -> size_t {
    return eui::hash(x);
  }
};

} // namespace std
