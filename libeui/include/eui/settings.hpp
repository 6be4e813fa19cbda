//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#include "eui/to.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace eui {

namespace detail {

/// Reads the identifier at `key` as text or integer of `width` bytes and
/// stores its bytes in `output`.
/// @returns `false` if the key is absent.
caf::expected<bool> get_identifier(const caf::settings& cfg,
                                   std::string_view key,
                                   std::span<std::byte> output);

} // namespace detail

/// Reads an identifier from the configuration. The value may be identifier
/// text or a non-negative integer that fits into the identifier.
/// @returns `std::nullopt` if `key` is absent.
template <identifier T>
auto get_eui(const caf::settings& cfg, std::string_view key)
  -> caf::expected<std::optional<T>> {
  auto bytes = typename T::byte_array{};
  auto found = detail::get_identifier(cfg, key, bytes);
  if (not found)
    return found.error();
  if (not *found)
    return std::optional<T>{};
  return std::optional<T>{T{bytes}};
}

} // namespace eui
