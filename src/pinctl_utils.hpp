// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <Pin.hpp>

#include <argparse/argparse.hpp>
#include <concepts>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>

enum class Verbosity { ERROR = 0, INFO = 1, DEBUG = 2, MAX = DEBUG };

template <std::integral T> Verbosity verbosity(T val) {
  return static_cast<Verbosity>(
      std::clamp(val, T{0}, static_cast<T>(Verbosity::MAX)));
}

struct AugmentedParser {
  argparse::ArgumentParser parser;
  int verbosity = 0;
};

std::unique_ptr<AugmentedParser> get_parser();

template <typename T> std::string format_optional(std::optional<T> const &v) {
  return v ? fmt::format("{}", *v) : std::string{"none"};
}

void print_pin_info(std::ostream &os, Pin const &pin);

// Applies --pull, --edges and --bounce, each only when given
void configure_input(argparse::ArgumentParser const &args, Pin &pin);

// Calls poll every 100ms until the duration elapsed, a backend call inside
// poll raises IGPIO::Interrupted on SIGINT/SIGTERM
void run_for(std::chrono::duration<double> duration,
             std::function<void()> const &poll);

void execOutput(argparse::ArgumentParser const &args, Pin &pin,
                Verbosity verbose);

void execPWM(argparse::ArgumentParser const &args, Pin &pin,
             Verbosity verbose);

void execWatch(argparse::ArgumentParser const &args, Pin &pin,
               Verbosity verbose);
