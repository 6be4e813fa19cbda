//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace eui::detail {

template <class... Ts>
constexpr void discard(Ts&&...) noexcept {
  // nop
}

} // namespace eui::detail

/// Evaluates its arguments for their side effects only, so that compiled-out
/// log statements do not trigger unused-variable warnings.
#define EUI_DISCARD_ARGS(...) ::eui::detail::discard(__VA_ARGS__)
