//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/settings.hpp"

#include "eui/detail/parse_hex.hpp"
#include "eui/error.hpp"
#include "eui/logger.hpp"

#include <caf/config_value.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string>

namespace eui::detail {

caf::expected<bool> get_identifier(const caf::settings& cfg,
                                   std::string_view key,
                                   std::span<std::byte> output) {
  const auto width = output.size();
  const auto* value = caf::get_if(&cfg, key);
  if (value == nullptr) {
    EUI_TRACE("no identifier configured at {}", key);
    return false;
  }
  if (const auto* str = caf::get_if<std::string>(value)) {
    if (auto err = parse_hex(*str, output)) {
      EUI_DEBUG("rejected identifier '{}' at {}: {}", *str, key, err);
      return add_context(to_error(err, width), "invalid value for key '{}'",
                         key);
    }
    return true;
  }
  if (const auto* integer = caf::get_if<caf::config_value::integer>(value)) {
    const auto max = width >= 8 ? std::numeric_limits<uint64_t>::max()
                                : (uint64_t{1} << (8 * width)) - 1;
    if (*integer < 0 || static_cast<uint64_t>(*integer) > max)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("value {} for key '{}' does not fit "
                                         "into {} bytes",
                                         *integer, key, width));
    const auto x = static_cast<uint64_t>(*integer);
    for (size_t i = 0; i < width; ++i)
      output[i] = static_cast<std::byte>((x >> (8 * (width - 1 - i))) & 0xff);
    return true;
  }
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("invalid value for key '{}': expected "
                                     "identifier text or an integer",
                                     key));
}

} // namespace eui::detail
