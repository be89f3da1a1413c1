// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT

#include <iostream>
#include <ostream>

#include "pinctl_utils.hpp"

#include <IGPIO.hpp>
#include <PinFactory.hpp>

#include <argparse/argparse.hpp>

int main(int argc, char *argv[]) try {
  auto pparser = get_parser();
  auto &aug_parser = *pparser;
  auto &parser = aug_parser.parser;
  parser.parse_args(argc, argv);
  const auto verbose = verbosity(aug_parser.verbosity);

  PinFactory factory;
  auto pin = factory.pin(parser.get<unsigned>("pin"));

  if (parser.present("--output")) {
    execOutput(parser, *pin, verbose);
  } else if (parser.present("--pwm")) {
    execPWM(parser, *pin, verbose);
  } else if (parser["--watch"] == true) {
    execWatch(parser, *pin, verbose);
  } else {
    configure_input(parser, *pin);
    print_pin_info(std::cout, *pin);
  }
  return 0;
} catch (IGPIO::Interrupted const &e) {
  std::cerr << e.what() << '\n';
  return 0;
} catch (const std::exception &e) {
  std::cerr << "ERROR:" << e.what() << '\n';
  return -1;
} catch (...) {
  std::cerr << "ERROR: Unknown exception occurred...\n";
  return -2;
}
