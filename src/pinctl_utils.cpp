// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "pinctl_utils.hpp"

#include <PinTypes.hpp>

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

std::unique_ptr<AugmentedParser> get_parser() {
  std::unique_ptr<AugmentedParser> parser(new AugmentedParser{

      argparse::ArgumentParser{"pinctl", PINCTL_VER,
                               argparse::default_arguments::all},
      0});

  auto *program = &parser->parser;
  program->add_description(
      "Inspects or drives a single GPIO pin. Without an action the pin's "
      "attributes are printed.");
  program->add_argument("pin")
      .help("BCM GPIO number of the pin")
      .scan<'i', unsigned>();

  // Exec section
  auto &exec_group = program->add_mutually_exclusive_group();

  exec_group.add_argument("-o", "--output")
      .help("switch the pin to output and write the given level (0 or 1)")
      .scan<'i', unsigned>();

  exec_group.add_argument("-p", "--pwm")
      .help("run software PWM with the given frequency in Hz")
      .scan<'g', double>();

  exec_group.add_argument("-w", "--watch")
      .help("print the edges detected on the pin")
      .flag();

  program->add_argument("-d", "--duty")
      .help("duty cycle of the PWM, between 0 and 1")
      .default_value(0.5)
      .scan<'g', double>();

  program->add_argument("--pull").help(
      "pull resistor of the input: up, down or floating");

  program->add_argument("-b", "--bounce")
      .help("ignore edges closer than this many seconds to the previous one")
      .scan<'g', double>();

  program->add_argument("-e", "--edges")
      .help("edges to report when watching: both, rising or falling");

  program->add_argument("-t", "--duration")
      .help("seconds to keep the PWM running or to watch the pin")
      .default_value(10.0)
      .scan<'g', double>();

  program->add_argument("-V", "--verbose")
      .action([verbose = std::addressof(parser->verbosity)](const auto &) {
        *verbose += 1;
      })
      .append()
      .nargs(0)
      .help("print more information about the operation")
      .default_value(false)
      .implicit_value(true);
  return parser;
}

void print_pin_info(std::ostream &os, Pin const &pin) {
  const auto bounce = pin.bounce();
  os << fmt::format("{}:\n"
                    "  function: {}\n"
                    "  pull: {}{}\n"
                    "  state: {}\n"
                    "  frequency: {}\n"
                    "  bounce: {}\n"
                    "  edges: {}\n",
                    pin.name(), to_string(pin.function()),
                    to_string(pin.pull()), pin.fixed_pull() ? " (fixed)" : "",
                    pin.state(), format_optional(pin.frequency()),
                    bounce ? fmt::format("{}s", bounce->count()) : "none",
                    to_string(pin.edges()));
}

void configure_input(argparse::ArgumentParser const &args, Pin &pin) {
  if (const auto pull = args.present("--pull"); pull) {
    pin.set_pull(std::string_view{*pull});
  }
  if (const auto edges = args.present("--edges"); edges) {
    pin.set_edges(std::string_view{*edges});
  }
  if (const auto bounce = args.present<double>("--bounce"); bounce) {
    pin.set_bounce(Pin::seconds{*bounce});
  }
}

void run_for(std::chrono::duration<double> duration,
             std::function<void()> const &poll) {
  using clock = std::chrono::steady_clock;
  const auto deadline =
      clock::now() + std::chrono::duration_cast<clock::duration>(duration);
  while (clock::now() < deadline) {
    poll();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

void execOutput(argparse::ArgumentParser const &args, Pin &pin,
                Verbosity verbose) {
  const auto level = args.get<unsigned>("--output");
  pin.set_function(Function::OUTPUT);
  pin.set_state(level);
  if (verbose >= Verbosity::INFO) {
    std::cout << fmt::format("{} set to {}\n", pin.name(), pin.state());
  }
}

void execPWM(argparse::ArgumentParser const &args, Pin &pin,
             Verbosity verbose) {
  const auto frequency = args.get<double>("--pwm");
  const auto duty = args.get<double>("--duty");
  const auto duration = args.get<double>("--duration");
  pin.set_function(Function::OUTPUT);
  pin.set_frequency(frequency);
  pin.set_state(duty);
  if (verbose >= Verbosity::INFO) {
    std::cout << fmt::format("PWM on {}: {}Hz, duty cycle {} for {}s\n",
                             pin.name(), frequency, pin.state(), duration);
  }
  run_for(Pin::seconds{duration}, [&pin] { pin.function(); });
  pin.set_frequency(std::nullopt);
}

void execWatch(argparse::ArgumentParser const &args, Pin &pin,
               Verbosity verbose) {
  const auto duration = args.get<double>("--duration");
  pin.set_function(Function::INPUT);
  configure_input(args, pin);
  if (verbose >= Verbosity::INFO) {
    print_pin_info(std::cout, pin);
  }
  // outlives this scope if the callback is still attached on interruption
  struct Output {
    std::mutex mutex;
    std::optional<std::chrono::nanoseconds> first;
  };
  pin.set_when_changed([out = std::make_shared<Output>(),
                        verbose](EdgeEvent const &event) {
    std::lock_guard lock{out->mutex};
    if (!out->first) {
      out->first = event.timestamp;
    }
    if (verbose >= Verbosity::DEBUG) {
      const auto offset =
          std::chrono::duration<double>(event.timestamp - *out->first);
      std::cout << fmt::format("{:10.6f}s GPIO{} -> {}\n", offset.count(),
                               event.port, event.state ? 1 : 0);
    } else {
      std::cout << fmt::format("GPIO{} {}\n", event.port,
                               event.state ? "rising" : "falling");
    }
    std::cout.flush();
  });
  run_for(Pin::seconds{duration}, [&pin] { pin.state(); });
  pin.set_when_changed(nullptr);
}
