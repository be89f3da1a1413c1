// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT

#include "libGPIO.hpp"

#include <IGPIO.hpp>

#include <algorithm>
#include <bitset>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <memory>
#include <stdexcept>

#include <signal.h>

#include <gpiod.hpp>

using Reason = IGPIO::Error::Reason;

namespace {
volatile sig_atomic_t s_interrupted = 0;

constexpr auto CONSUMER = "pinfactory";
// upper bound of the reaction time of the workers to a stop request
constexpr auto POLL_PERIOD = std::chrono::milliseconds(10);

void catch_signals(int sig) {
  s_interrupted = 1;
  signal(sig, catch_signals);
}

void register_signal_handler(int sig, sighandler_t handler) {
  if (::signal(sig, handler) == SIG_ERR) {
    std::cerr << fmt::format("Warning: can't register signal handler for {}!\n",
                             sig);
  }
}

std::bitset<32> bias_flags(IGPIO::Pull pull) {
  switch (pull) {
  case IGPIO::Pull::UP:
    return gpiod::line_request::FLAG_BIAS_PULL_UP;
  case IGPIO::Pull::DOWN:
    return gpiod::line_request::FLAG_BIAS_PULL_DOWN;
  case IGPIO::Pull::OFF:
    return gpiod::line_request::FLAG_BIAS_DISABLE;
  }
  throw IGPIO::Error(Reason::InvalidValue,
                     fmt::format("Invalid pull {}", static_cast<int>(pull)));
}

int event_request(IGPIO::Edge edge) {
  switch (edge) {
  case IGPIO::Edge::RISING:
    return gpiod::line_request::EVENT_RISING_EDGE;
  case IGPIO::Edge::FALLING:
    return gpiod::line_request::EVENT_FALLING_EDGE;
  case IGPIO::Edge::BOTH:
    return gpiod::line_request::EVENT_BOTH_EDGES;
  }
  throw IGPIO::Error(Reason::InvalidValue,
                     fmt::format("Invalid edge {}", static_cast<int>(edge)));
}

// Runs a libgpiod call, turning its system errors into IGPIO errors
template <typename F, typename... Args>
decltype(auto) guarded(F &&f, fmt::format_string<Args...> what,
                       Args &&...args) {
  try {
    return f();
  } catch (std::system_error const &e) {
    const auto reason = e.code() == std::errc::device_or_resource_busy
                            ? Reason::Busy
                            : Reason::Failure;
    const auto msg = fmt::format(what, std::forward<Args>(args)...);
    throw IGPIO::Error(reason, fmt::format("{} ({})", msg, e.what()));
  }
}

template <typename Clock, typename Duration>
void sleep_until(std::chrono::time_point<Clock, Duration> deadline,
                 std::atomic<bool> const &stop) {
  for (auto now = Clock::now(); now < deadline && !stop; now = Clock::now()) {
    std::this_thread::sleep_for(
        std::min<typename Clock::duration>(deadline - now, POLL_PERIOD));
  }
}

} // namespace

IGPIO::Ptr IGPIO::Create() { return std::make_shared<LibGPIO>(); }

void LibGPIO::Worker::stop() {
  *m_stop = true;
  if (!m_thread.joinable()) {
    return;
  }
  if (m_thread.get_id() == std::this_thread::get_id()) {
    m_thread.detach();
  } else {
    m_thread.join();
  }
}

LibGPIO::LibGPIO(std::string_view device)
    : m_handle(::gpiod::chip(std::string(device))) {
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
}

LibGPIO::~LibGPIO() {
  try {
    cleanup();
  } catch (std::exception const &e) {
    std::cerr << fmt::format("Warning: GPIO cleanup failed: {}\n", e.what());
  }
}

void LibGPIO::ensure_initialized() const {
  if (!m_handle) {
    throw Error(Reason::Failure, "GPIO chip not opened");
  }
}

auto LibGPIO::get_line(port_id_t gpio) -> LineState & {
  ensure_initialized();
  auto it = m_lines.find(gpio);
  if (it != m_lines.end()) {
    return it->second;
  }
  auto line = guarded([&] { return m_handle.get_line(gpio); },
                      "No line {} on the chip", gpio);
  if (m_warnings && line.is_used()) {
    std::cerr << fmt::format("Warning: GPIO {} is already in use by {}\n",
                             gpio, line.consumer());
  }
  guarded(
      [&] {
        line.request({.consumer = CONSUMER,
                      .request_type = gpiod::line_request::DIRECTION_AS_IS});
      },
      "Failed to request GPIO {}", gpio);
  const auto mode = line.direction() == gpiod::line::DIRECTION_OUTPUT
                        ? Modes::OUTPUT
                        : Modes::INPUT;
  auto res = m_lines.emplace(gpio, LineState{std::move(line), mode});
  return res.first->second;
}

auto LibGPIO::claimed_line(port_id_t gpio) -> LineState & {
  ensure_initialized();
  auto it = m_lines.find(gpio);
  if (it == m_lines.end()) {
    throw Error(Reason::WrongDirection,
                fmt::format("GPIO {} has not been set up", gpio));
  }
  return it->second;
}

void LibGPIO::request(port_id_t port, LineState &state, int request_type,
                      val_t initial) {
  guarded(
      [&] {
        if (state.line.is_requested()) {
          state.line.release();
        }
        state.line.request({.consumer = CONSUMER,
                            .request_type = request_type,
                            .flags = bias_flags(state.pull)},
                           static_cast<int>(initial));
      },
      "Failed to request GPIO {}", port);
}

void LibGPIO::set_gpio_mode(port_id_t port, Modes mode, val_t initial) {
  ensure_running();
  if (mode != Modes::INPUT && mode != Modes::OUTPUT) {
    throw Error(Reason::InvalidValue, "Only INPUT and OUTPUT modes are "
                                      "supported for libgpiod for now.");
  }
  if (mode == Modes::INPUT) {
    pwm_stop(port);
  }
  std::lock_guard lock{m_mutex};
  auto &state = get_line(port);
  if (state.edge) {
    if (mode == Modes::OUTPUT) {
      throw Error(Reason::WrongDirection,
                  fmt::format("Edge detection is active on GPIO {}", port));
    }
    return;
  }
  if (mode == Modes::OUTPUT) {
    state.pull = Pull::OFF;
    request(port, state, gpiod::line_request::DIRECTION_OUTPUT, initial);
  } else {
    request(port, state, gpiod::line_request::DIRECTION_INPUT);
  }
  state.mode = mode;
}

auto LibGPIO::gpio_mode(port_id_t port) -> Modes {
  ensure_running();
  std::lock_guard lock{m_mutex};
  return get_line(port).mode;
}

void LibGPIO::set_pull(port_id_t port, Pull pull) {
  ensure_running();
  std::unique_lock lock{m_mutex};
  auto &state = claimed_line(port);
  if (state.mode != Modes::INPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("Trying to set pull on non-input GPIO {}", port));
  }
  // the bias of an event request can only change with a new request
  auto watcher = std::move(state.watcher);
  if (watcher) {
    lock.unlock();
    watcher->stop();
    lock.lock();
  }
  auto &line = claimed_line(port);
  line.pull = pull;
  if (line.edge) {
    request(port, line, event_request(*line.edge));
    start_watcher(port, line);
  } else {
    request(port, line, gpiod::line_request::DIRECTION_INPUT);
  }
}

void LibGPIO::gpio_write(port_id_t gpio, val_t val) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(gpio);
  if (state.mode != Modes::OUTPUT) {
    throw Error(Reason::WrongDirection,
                "Trying to write GPIO on non-output port");
  }
  if (val > 1) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid level {} for GPIO {}", val, gpio));
  }
  guarded([&] { state.line.set_value(static_cast<int>(val)); },
          "Failed to write {} on GPIO {}", val, gpio);
}

auto LibGPIO::gpio_read(port_id_t gpio) -> val_t {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(gpio);
  return guarded([&] { return static_cast<val_t>(state.line.get_value()); },
                 "Failed to read on GPIO {}", gpio);
}

void LibGPIO::pwm_start(port_id_t port, double frequency, double duty_cycle) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(port);
  if (state.mode != Modes::OUTPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("GPIO {} must be set up as an output for PWM",
                            port));
  }
  if (state.pwm) {
    throw Error(Reason::Busy,
                fmt::format("PWM already running on GPIO {}", port));
  }
  if (!(frequency > 0.0) || !(duty_cycle >= 0.0 && duty_cycle <= 100.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid PWM settings {}Hz {}% for GPIO {}",
                            frequency, duty_cycle, port));
  }
  auto settings = std::make_shared<PWMSettings>();
  settings->frequency = frequency;
  settings->duty_cycle = duty_cycle;
  state.pwm_settings = settings;
  state.pwm = std::make_unique<Worker>(
      [line = state.line, settings, port](Worker::StopFlag stop) {
        using clock = std::chrono::steady_clock;
        try {
          for (auto next = clock::now(); !*stop;) {
            const auto period =
                std::chrono::duration<double>(1.0 / settings->frequency);
            const auto high = std::chrono::duration_cast<clock::duration>(
                period * (settings->duty_cycle / 100.0));
            const auto low =
                std::chrono::duration_cast<clock::duration>(period) - high;
            if (high.count() > 0) {
              line.set_value(1);
              sleep_until(next += high, *stop);
            }
            if (low.count() > 0) {
              line.set_value(0);
              sleep_until(next += low, *stop);
            }
          }
        } catch (std::exception const &e) {
          std::cerr << fmt::format("PWM on GPIO {} stopped: {}\n", port,
                                   e.what());
        }
      });
}

void LibGPIO::pwm_set_frequency(port_id_t port, double frequency) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(port);
  if (!state.pwm) {
    throw Error(Reason::Failure,
                fmt::format("No PWM running on GPIO {}", port));
  }
  if (!(frequency > 0.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid PWM frequency {}", frequency));
  }
  state.pwm_settings->frequency = frequency;
}

void LibGPIO::pwm_set_duty_cycle(port_id_t port, double duty_cycle) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(port);
  if (!state.pwm) {
    throw Error(Reason::Failure,
                fmt::format("No PWM running on GPIO {}", port));
  }
  if (!(duty_cycle >= 0.0 && duty_cycle <= 100.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid duty cycle {}", duty_cycle));
  }
  state.pwm_settings->duty_cycle = duty_cycle;
}

void LibGPIO::pwm_stop(port_id_t port) {
  ensure_running();
  std::unique_lock lock{m_mutex};
  auto it = m_lines.find(port);
  if (it == m_lines.end() || !it->second.pwm) {
    return;
  }
  auto worker = std::move(it->second.pwm);
  it->second.pwm_settings.reset();
  // the worker may be waiting for the lock in a callback
  lock.unlock();
  worker->stop();
  lock.lock();
  if (it = m_lines.find(port); it != m_lines.end()) {
    guarded([&] { it->second.line.set_value(0); },
            "Failed to stop PWM on GPIO {}", port);
  }
}

void LibGPIO::add_event_detect(port_id_t port, Edge edge,
                               EventCallback callback) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  auto &state = claimed_line(port);
  if (state.mode != Modes::INPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("Edge detection needs an input, GPIO {}", port));
  }
  if (state.edge) {
    throw Error(Reason::Busy,
                fmt::format("Conflicting edge detection already enabled on "
                            "GPIO {}",
                            port));
  }
  request(port, state, event_request(edge));
  state.edge = edge;
  state.callback = std::move(callback);
  start_watcher(port, state);
}

void LibGPIO::start_watcher(port_id_t port, LineState &state) {
  state.watcher = std::make_unique<Worker>(
      [line = state.line, port,
       callback = state.callback](Worker::StopFlag stop) {
        try {
          while (!*stop) {
            if (!line.event_wait(POLL_PERIOD)) {
              continue;
            }
            const auto event = line.event_read();
            const val_t level =
                event.event_type == gpiod::line_event::RISING_EDGE ? 1 : 0;
            if (!*stop) {
              callback(Event{port, level, event.timestamp});
            }
          }
        } catch (std::exception const &e) {
          if (!*stop) {
            std::cerr << fmt::format("Edge detection on GPIO {} stopped: {}\n",
                                     port, e.what());
          }
        }
      });
}

void LibGPIO::remove_event_detect(port_id_t port) {
  ensure_running();
  std::unique_lock lock{m_mutex};
  auto it = m_lines.find(port);
  if (it == m_lines.end() || !it->second.edge) {
    return;
  }
  auto worker = std::move(it->second.watcher);
  it->second.edge.reset();
  it->second.callback = nullptr;
  lock.unlock();
  if (worker) {
    worker->stop();
  }
  lock.lock();
  if (it = m_lines.find(port); it != m_lines.end()) {
    request(port, it->second, gpiod::line_request::DIRECTION_INPUT);
  }
}

void LibGPIO::release(port_id_t port) {
  ensure_running();
  pwm_stop(port);
  remove_event_detect(port);
  std::lock_guard lock{m_mutex};
  auto it = m_lines.find(port);
  if (it == m_lines.end()) {
    return;
  }
  it->second.pull = Pull::OFF;
  it->second.mode = Modes::INPUT;
  request(port, it->second, gpiod::line_request::DIRECTION_INPUT);
  guarded([&] { it->second.line.release(); }, "Failed to release GPIO {}",
          port);
  m_lines.erase(it);
}

void LibGPIO::cleanup() {
  std::vector<port_id_t> ports;
  {
    std::lock_guard lock{m_mutex};
    if (!m_handle) {
      return;
    }
    for (const auto &[port, state] : m_lines) {
      ports.push_back(port);
    }
  }
  for (const auto port : ports) {
    release(port);
  }
  std::lock_guard lock{m_mutex};
  m_handle.reset();
}

void LibGPIO::set_warnings(bool enabled) {
  std::lock_guard lock{m_mutex};
  m_warnings = enabled;
}

void LibGPIO::ensure_running() {
  // Don't throw if there's already an exception in-flight
  if (s_interrupted && std::uncaught_exceptions() == 0) {
    throw Interrupted{};
  }
}
