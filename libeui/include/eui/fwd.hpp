//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "eui/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstddef>
#include <cstdint>

#define EUI_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(eui_types, type)

namespace eui {

// -- classes ------------------------------------------------------------------

template <size_t Width>
class basic_eui;

class parse_error;
class xxh3_64;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;
enum class parse_errc : uint8_t;

// -- aliases ------------------------------------------------------------------

using eui48 = basic_eui<6>;
using eui64 = basic_eui<8>;

// -- templates ----------------------------------------------------------------

template <class>
struct is_uniquely_represented;

} // namespace eui

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_eui_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(eui_types, first_eui_type_id)

  EUI_ADD_TYPE_ID((eui::ec))
  EUI_ADD_TYPE_ID((eui::eui48))
  EUI_ADD_TYPE_ID((eui::eui64))
  EUI_ADD_TYPE_ID((eui::parse_error))

CAF_END_TYPE_ID_BLOCK(eui_types)
