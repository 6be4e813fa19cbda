//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/test/serialization.hpp"

#include "eui/error.hpp"
#include "eui/eui.hpp"
#include "eui/parse_error.hpp"

#include <caf/binary_deserializer.hpp>
#include <caf/binary_serializer.hpp>
#include <caf/byte_buffer.hpp>
#include <caf/json_reader.hpp>
#include <caf/message.hpp>

using namespace eui;

namespace {

constexpr auto x48 = eui48{85204980412143};
constexpr auto x64 = eui64{5583992946972634863};

} // namespace

TEST("binary formats see the raw bytes") {
  auto buffer = check_binary_serialization(x48);
  CHECK_EQUAL(buffer.size(), 6u);
  CHECK(buffer[0] == std::byte{0x4d});
  CHECK(buffer[5] == std::byte{0xef});
  CHECK_EQUAL(check_binary_serialization(x64).size(), 8u);
}

TEST("human-readable formats see the canonical text") {
  auto json = check_json_serialization(x48);
  CHECK_NOT_EQUAL(json.find("4d7e54972eef"), std::string::npos);
  check_json_serialization(x64);
}

TEST("loading accepts separated text") {
  auto reader = caf::json_reader{};
  REQUIRE(reader.load(R"_("4D:7E:54:97:2E:EF")_"));
  auto x = eui48{};
  CHECK(reader.apply(x));
  CHECK_EQUAL(x, x48);
}

TEST("loading reports malformed text") {
  auto reader = caf::json_reader{};
  REQUIRE(reader.load(R"_("4d:7e:54-97:2e:ef")_"));
  auto x = eui48{};
  CHECK(! reader.apply(x));
  CHECK_EQUAL(reader.get_error(), ec::mixed_separators);
  CHECK_EQUAL(x, eui48{});
}

TEST("parse errors") {
  check_serialization(parse_error::invalid_length(17));
  check_serialization(parse_error::invalid_char('s'));
  check_serialization(parse_error::only_one_separator_type_expected());
}

TEST("messages") {
  auto msg = caf::make_message(x48, x64, parse_error::invalid_char('s'));
  auto buffer = caf::byte_buffer{};
  auto sink = caf::binary_serializer{nullptr, buffer};
  REQUIRE(sink.apply(msg));
  auto copy = caf::message{};
  auto source = caf::binary_deserializer{nullptr, buffer};
  REQUIRE(source.apply(copy));
  REQUIRE((copy.match_elements<eui48, eui64, parse_error>()));
  CHECK_EQUAL(copy.get_as<eui48>(0), x48);
  CHECK_EQUAL(copy.get_as<eui64>(1), x64);
  CHECK_EQUAL(copy.get_as<parse_error>(2), parse_error::invalid_char('s'));
}
