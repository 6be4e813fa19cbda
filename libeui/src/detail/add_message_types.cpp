//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/add_message_types.hpp"

#include "eui/error.hpp"
#include "eui/eui.hpp"
#include "eui/parse_error.hpp"

#include <caf/init_global_meta_objects.hpp>

namespace eui::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::eui_types>();
}

} // namespace eui::detail
