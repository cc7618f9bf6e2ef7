// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "prog_utils.hpp"

#include <argparse/argparse.hpp>

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  parser.parse_args(argc, argv);
  const auto log = Log{verbosity(aug_parser.verbosity)};

  const auto session = load_session(parser, log);

  if (parser["--regions"] == true) {
    return execRegions(session, log);
  } else if (parser["--check"] == true) {
    return execCheck(session, log);
  } else if (parser["--write"] == true) {
    return execWrite(parser, session, log);
  } else if (parser["--dump"] == true) {
    return execDump(session);
  }

  std::cerr << parser;
  return 1;
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return -1;
} catch (...) {
  std::cerr << "ERROR: Unknown exception occurred...\n";
  return -2;
}
