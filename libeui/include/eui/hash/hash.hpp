//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/hash/uniquely_represented.hpp"
#include "eui/hash/xxhash.hpp"

#include <span>

namespace eui {

/// The hash algorithm for `std::hash` specializations of libeui types.
using default_hash = xxh3_64;

/// Hashes the object representation of a uniquely represented value.
template <class HashAlgorithm = default_hash, uniquely_represented T>
auto hash(const T& x) noexcept -> typename HashAlgorithm::result_type {
  return HashAlgorithm::make(std::as_bytes(std::span<const T, 1>{&x, 1}));
}

} // namespace eui
