//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/hash/xxhash.hpp"

namespace eui {

xxh3_64::xxh3_64(seed_type seed) noexcept {
  XXH3_INITSTATE(&state_);
  // Resetting a stack-allocated state only fails for a null pointer.
  [[maybe_unused]] auto result = XXH3_64bits_reset_withSeed(&state_, seed);
}

void xxh3_64::add(std::span<const std::byte> bytes) noexcept {
  // XXH3 rejects a null pointer even for zero bytes.
  if (bytes.empty())
    return;
  [[maybe_unused]] auto result
    = XXH3_64bits_update(&state_, bytes.data(), bytes.size());
}

auto xxh3_64::finish() noexcept -> result_type {
  return XXH3_64bits_digest(&state_);
}

auto xxh3_64::make(std::span<const std::byte> bytes, seed_type seed) noexcept
  -> result_type {
  return XXH3_64bits_withSeed(bytes.data(), bytes.size(), seed);
}

} // namespace eui
