//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/fwd.hpp"

#ifndef XXH_STATIC_LINKING_ONLY
#  define XXH_STATIC_LINKING_ONLY
#endif
#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <span>

namespace eui {

/// The 64-bit version of the XXH3 hash algorithm.
class xxh3_64 {
public:
  using result_type = uint64_t;
  using seed_type = XXH64_hash_t;

  static constexpr seed_type default_seed = 0;

  explicit xxh3_64(seed_type seed = default_seed) noexcept;

  void add(std::span<const std::byte> bytes) noexcept;

  auto finish() noexcept -> result_type;

  /// Hashes `bytes` in one go.
  static auto make(std::span<const std::byte> bytes,
                   seed_type seed = default_seed) noexcept -> result_type;

private:
  XXH3_state_t state_;
};

} // namespace eui
