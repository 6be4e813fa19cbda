//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/to.hpp"

#include "eui/test/test.hpp"

#include <string>

using namespace eui;

TEST("valid text") {
  CHECK_EQUAL(unbox(to<eui48>("4d7e54972eef")), eui48{85204980412143});
  CHECK_EQUAL(unbox(to<eui48>("4D7E54972EEF")), eui48{85204980412143});
  CHECK_EQUAL(unbox(to<eui48>("4d:7e:54:97:2e:ef")), eui48{85204980412143});
  CHECK_EQUAL(unbox(to<eui48>("4D-7E-54-97-2E-EF")), eui48{85204980412143});
  CHECK_EQUAL(unbox(to<eui64>("4d7e540000972eef")),
              eui64{5583992946972634863});
  CHECK_EQUAL(unbox(to<eui64>("4D:7E:54:00:00:97:2E:EF")),
              eui64{5583992946972634863});
}

TEST("each failure kind has its own error code") {
  CHECK_EQUAL(to<eui48>("4d7e54972e").error(), ec::invalid_length);
  CHECK_EQUAL(to<eui48>("4d7e54972eefef4da").error(), ec::invalid_length);
  CHECK_EQUAL(to<eui48>("ad7e54972esa").error(), ec::invalid_character);
  CHECK_EQUAL(to<eui48>(":4d7e:54:97:2e:ef").error(),
              ec::invalid_separator_place);
  CHECK_EQUAL(to<eui48>("4d:7e:54-97:2e:ef").error(), ec::mixed_separators);
  CHECK_EQUAL(to<eui64>("4d7e54972eaa").error(), ec::invalid_length);
  CHECK_EQUAL(to<eui64>("ad7e54972ea721sa").error(), ec::invalid_character);
  CHECK_EQUAL(to<eui64>("4d::7e54:00:00:97:2e:ef").error(),
              ec::invalid_separator_place);
  CHECK_EQUAL(to<eui64>("4d:7e-54:00:00:97:2e-ef").error(),
              ec::mixed_separators);
}

TEST("diagnostics name the offending input") {
  CHECK_EQUAL(render(to<eui48>("4d7e54972eefef4da").error()),
              "invalid_length: invalid length 17, expected 12 byte string "
              "with only hexadecimal characters or 17 byte string with "
              "hexadecimal characters and separator after every second "
              "character");
  CHECK_EQUAL(render(to<eui64>("ad7e54972ea721sa").error()),
              "invalid_character: invalid value: character `s`, expected 16 "
              "byte string with only hexadecimal characters or 23 byte string "
              "with hexadecimal characters and separator after every second "
              "character");
  CHECK_EQUAL(render(to<eui48>("4d:7e:54:97:2eef:").error()),
              "invalid_separator_place: Separator must be placed after every "
              "second character");
}
