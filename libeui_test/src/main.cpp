//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "eui/detail/add_message_types.hpp"
#include "eui/error.hpp"
#include "eui/logger.hpp"
#include "eui/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <caf/test/runner.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Returns the position of the '--' delimiter, or `argc` if there is none.
int find_delimiter(int argc, char** argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  return static_cast<int>(std::find(start, end, delimiter) - argv);
}

} // namespace

int main(int argc, char** argv) {
  std::string eui_loglevel = "quiet";
  auto caf_argc = find_delimiter(argc, argv);
  auto test_args = std::vector<std::string>{};
  if (caf_argc < argc)
    test_args.assign(argv + caf_argc + 1, argv + argc);
  if (! test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(eui_loglevel, "eui-verbosity",
                          "console verbosity for libeui")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return EXIT_FAILURE;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return EXIT_SUCCESS;
    }
    eui::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  eui::detail::add_message_types();
  caf::settings log_settings;
  put(log_settings, "eui.console-verbosity", eui_loglevel);
  put(log_settings, "eui.console-format", "%^[%s:%#] %v%$");
  auto log_context = eui::create_log_context(log_settings);
  if (! log_context) {
    std::cerr << "failed to set up logging: "
              << eui::render(log_context.error()) << std::endl;
    return EXIT_FAILURE;
  }
  // Run the unit tests.
  return caf::test::runner{}.run(caf_argc, argv);
}
