//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/eui.hpp"

namespace eui {

static_assert(sizeof(eui48) == eui48::num_bytes);
static_assert(sizeof(eui64) == eui64::num_bytes);
static_assert(uniquely_represented<eui48>);
static_assert(uniquely_represented<eui64>);

static_assert(eui48{0x4d7e54972eefull}.to_u64() == 0x4d7e54972eefull);
static_assert(eui64{eui48{0x4d7e54972eefull}}.to_u64()
              == 0x4d7e540000972eefull);

template class basic_eui<6>;
template class basic_eui<8>;

} // namespace eui
