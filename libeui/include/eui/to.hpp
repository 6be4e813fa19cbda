//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/error.hpp"
#include "eui/eui.hpp"
#include "eui/logger.hpp"

#include <caf/expected.hpp>

#include <string_view>

namespace eui {

namespace detail {

template <class T>
struct is_eui : std::false_type {};

template <size_t Width>
struct is_eui<basic_eui<Width>> : std::true_type {};

} // namespace detail

template <class T>
concept identifier = detail::is_eui<T>::value;

/// Parses identifier text and translates a failure into an error whose code
/// identifies the failure kind and whose message names the offending length
/// or character.
template <identifier T>
auto to(std::string_view str) -> caf::expected<T> {
  auto result = T{};
  if (auto err = T::parse(str, result)) {
    EUI_DEBUG("rejected {}-bit identifier '{}': {}", 8 * T::num_bytes, str,
              err);
    return to_error(err, T::num_bytes);
  }
  return result;
}

} // namespace eui
