//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace eui {

/// A type is *uniquely represented* if two objects of that type compare equal
/// *iff* their object representations are equal. Hashing such a type reduces
/// to hashing its bytes.
template <class T>
struct is_uniquely_represented
  : std::bool_constant<std::is_integral_v<T> || std::is_enum_v<T>
                       || std::is_pointer_v<T>> {};

template <class T>
struct is_uniquely_represented<const T> : is_uniquely_represented<T> {};

template <class T, size_t N>
struct is_uniquely_represented<std::array<T, N>>
  : std::bool_constant<is_uniquely_represented<T>::value
                       && sizeof(T) * N == sizeof(std::array<T, N>)> {};

template <class T>
concept uniquely_represented = is_uniquely_represented<T>::value;

} // namespace eui
