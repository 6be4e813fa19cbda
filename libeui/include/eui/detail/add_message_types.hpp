//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace eui::detail {

/// Registers the meta objects of all EUI types with CAF. Must be called once
/// before serializing any of them.
void add_message_types();

} // namespace eui::detail
