// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT
#include <IGPIO.hpp>
#include <MockGPIO.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <stdexcept>

using Reason = IGPIO::Error::Reason;

namespace {
volatile sig_atomic_t s_interrupted = 0;

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

bool matches(IGPIO::Edge edge, IGPIO::val_t level) {
  switch (edge) {
  case IGPIO::Edge::RISING:
    return level != 0;
  case IGPIO::Edge::FALLING:
    return level == 0;
  case IGPIO::Edge::BOTH:
    return true;
  }
  return false;
}

} // namespace

__attribute__((weak)) IGPIO::Ptr IGPIO::Create() { return MockGPIO::Create(); }

std::shared_ptr<MockGPIO> MockGPIO::Create() {
  return std::make_shared<MockGPIO>();
}

void MockGPIO::ensure_initialized() const {
  if (!m_handle) {
    throw Error(Reason::Failure, "GPIO library not initialized");
  }
}

auto MockGPIO::line(port_id_t port) -> GPIOState & {
  if (auto it = m_gpios.find(port); it != m_gpios.end()) {
    return it->second;
  }
  return m_gpios.emplace(port, GPIOState{port}).first->second;
}

auto MockGPIO::claimed_line(port_id_t port) -> GPIOState & {
  auto it = m_gpios.find(port);
  if (it == m_gpios.end() || it->second.mode == Modes::UNDEFINED) {
    throw Error(Reason::WrongDirection,
                fmt::format("GPIO {} has not been set up", port));
  }
  return it->second;
}

auto MockGPIO::level(GPIOState const &state) -> val_t {
  switch (state.mode) {
  case Modes::INPUT:
    return state.driven.value_or(state.pull == Pull::UP ? 1 : 0);
  case Modes::OUTPUT:
    return state.val.value_or(0);
  default:
    return 0;
  }
}

void MockGPIO::set_gpio_mode(port_id_t port, Modes mode, val_t initial) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (m_busy.contains(port)) {
    throw Error(Reason::Busy, fmt::format("GPIO {} is busy", port));
  }
  if (m_stale.contains(port)) {
    if (m_warnings) {
      throw Error(Reason::Busy,
                  fmt::format("GPIO {} is already in use", port));
    }
    m_stale.erase(port);
  }
  if (mode == Modes::OUTPUT && initial > 1) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid initial value {} for GPIO {}", initial,
                            port));
  }
  auto &state = line(port);
  if (mode != Modes::OUTPUT) {
    state.pwm.reset();
    state.val.reset();
  }
  state.mode = mode;
  if (mode == Modes::OUTPUT) {
    state.pull = Pull::OFF;
    state.driven.reset();
    state.val = initial;
  }
}

auto MockGPIO::gpio_mode(port_id_t port) -> Modes {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (auto it = m_gpios.find(port); it != m_gpios.end()) {
    return it->second.mode;
  }
  return Modes::UNDEFINED;
}

void MockGPIO::set_pull(port_id_t port, Pull pull) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (state.mode != Modes::INPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("Trying to set pull on non-input GPIO {}", port));
  }
  if (pull != Pull::OFF && pull != Pull::DOWN && pull != Pull::UP) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid pull {} for GPIO {}",
                            static_cast<int>(pull), port));
  }
  if (m_fail_pull) {
    throw Error(Reason::Failure,
                fmt::format("Failed to set bias of GPIO {}", port));
  }
  state.pull = pull;
}

void MockGPIO::gpio_write(port_id_t gpio, val_t val) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (auto it = m_gpios.find(gpio);
      it == m_gpios.end() || it->second.mode != Modes::OUTPUT) {
    throw Error(Reason::WrongDirection,
                "Trying to write GPIO on non-output port");
  } else if (val > 1) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid level {} for GPIO {}", val, gpio));
  } else {
    it->second.val = val;
  }
}

IGPIO::val_t MockGPIO::gpio_read(port_id_t gpio) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  return level(claimed_line(gpio));
}

void MockGPIO::pwm_start(port_id_t port, double frequency, double duty_cycle) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (state.mode != Modes::OUTPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("GPIO {} must be set up as an output for PWM",
                            port));
  }
  if (m_busy.contains(port) || state.pwm) {
    throw Error(Reason::Busy,
                fmt::format("A PWM object already exists for GPIO {}", port));
  }
  if (!(frequency > 0.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid PWM frequency {}", frequency));
  }
  if (!(duty_cycle >= 0.0 && duty_cycle <= 100.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid duty cycle {}", duty_cycle));
  }
  state.pwm = PWMState{frequency, duty_cycle};
}

void MockGPIO::pwm_set_frequency(port_id_t port, double frequency) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (!state.pwm) {
    throw Error(Reason::Failure,
                fmt::format("No PWM running on GPIO {}", port));
  }
  if (!(frequency > 0.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid PWM frequency {}", frequency));
  }
  state.pwm->frequency = frequency;
}

void MockGPIO::pwm_set_duty_cycle(port_id_t port, double duty_cycle) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (!state.pwm) {
    throw Error(Reason::Failure,
                fmt::format("No PWM running on GPIO {}", port));
  }
  if (!(duty_cycle >= 0.0 && duty_cycle <= 100.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid duty cycle {}", duty_cycle));
  }
  state.pwm->duty_cycle = duty_cycle;
}

void MockGPIO::pwm_stop(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (state.pwm) {
    state.pwm.reset();
    // the line is left low as pigpio does
    state.val = 0;
  }
}

void MockGPIO::add_event_detect(port_id_t port, Edge edge,
                                EventCallback callback) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  auto &state = claimed_line(port);
  if (m_fail_event_detect) {
    throw Error(Reason::Busy, "Failed to add edge detection");
  }
  if (state.edge) {
    throw Error(Reason::Busy,
                "Conflicting edge detection already enabled for this GPIO "
                "channel");
  }
  state.edge = edge;
  state.callback = std::move(callback);
  ++m_registrations[port];
}

void MockGPIO::remove_event_detect(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (auto it = m_gpios.find(port); it != m_gpios.end()) {
    it->second.edge.reset();
    it->second.callback = nullptr;
  }
}

void MockGPIO::release(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  ++m_releases[port];
  if (auto it = m_gpios.find(port); it != m_gpios.end()) {
    auto &state = it->second;
    state.pwm.reset();
    state.edge.reset();
    state.callback = nullptr;
    state.mode = Modes::INPUT;
    state.pull = Pull::OFF;
    state.val.reset();
  }
}

void MockGPIO::cleanup() {
  std::lock_guard lock{m_mutex};
  if (!m_handle) {
    return;
  }
  for (auto &[port, state] : m_gpios) {
    release(port);
  }
  m_handle.reset();
}

void MockGPIO::set_warnings(bool enabled) {
  std::lock_guard lock{m_mutex};
  m_warnings = enabled;
}

void MockGPIO::drive(port_id_t port, val_t level,
                     std::chrono::nanoseconds timestamp) {
  std::lock_guard lock{m_mutex};
  auto &state = line(port);
  if (state.mode != Modes::INPUT) {
    throw std::logic_error(
        fmt::format("Driving GPIO {} which is not an input", port));
  }
  const auto previous = MockGPIO::level(state);
  state.driven = level ? 1 : 0;
  if (previous == *state.driven || !state.edge ||
      !matches(*state.edge, *state.driven)) {
    return;
  }
  // the callback may unregister itself
  auto callback = state.callback;
  callback(Event{port, *state.driven, timestamp});
}

void MockGPIO::drive(port_id_t port, val_t level) {
  drive(port, level,
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()));
}

void MockGPIO::set_busy(port_id_t port, bool busy) {
  std::lock_guard lock{m_mutex};
  if (busy) {
    m_busy.insert(port);
  } else {
    m_busy.erase(port);
  }
}

void MockGPIO::set_stale(port_id_t port, bool stale) {
  std::lock_guard lock{m_mutex};
  if (stale) {
    m_stale.insert(port);
  } else {
    m_stale.erase(port);
  }
}

unsigned MockGPIO::releases(port_id_t port) const {
  std::lock_guard lock{m_mutex};
  if (auto it = m_releases.find(port); it != m_releases.end()) {
    return it->second;
  }
  return 0;
}

unsigned MockGPIO::event_registrations(port_id_t port) const {
  std::lock_guard lock{m_mutex};
  if (auto it = m_registrations.find(port); it != m_registrations.end()) {
    return it->second;
  }
  return 0;
}

MockGPIO::MockGPIO() : m_handle(GPIOLibHandle::instance()) {}

GPIOLibHandle::GPIOLibHandle() {
  MockGPIO::ensure_running();
  initialized = true;
  terminated = false;
  ++init_cnt;
}
GPIOLibHandle::~GPIOLibHandle() { terminate(); }

GPIOLibHandle::Ref GPIOLibHandle::handle{};

bool GPIOLibHandle::initialized{false};
bool GPIOLibHandle::terminated{false};
unsigned GPIOLibHandle::init_cnt{0};

void GPIOLibHandle::terminate() {
  if (initialized && !terminated) {
    initialized = false;
    terminated = true;
  }
}

void GPIOLibHandle::atexit_cleanup() {
  if (auto p = weak_instance().lock(); p) {
    p->terminate();
  }
}
auto GPIOLibHandle::weak_instance() -> Ref { return handle; }

auto GPIOLibHandle::instance() -> Ptr {
  MockGPIO::ensure_running();

  if (auto p = handle.lock(); p) {
    return p;
  }
  auto p = Ptr(new GPIOLibHandle{}, [](GPIOLibHandle *p) { delete p; });
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
  const auto regexit = std::atexit(atexit_cleanup);
  const auto regqexit = std::at_quick_exit(atexit_cleanup);
  if (regexit || regqexit) {
    std::cerr << "Failed to register atexit cleanup function!\n";
  }
  handle = p;
  return p;
}

void MockGPIO::ensure_running() {
  // Don't throw if there's already an exception in-flight
  if (s_interrupted && std::uncaught_exceptions() == 0) {
    // reset back interrupt flag
    s_interrupted = 0;
    throw Interrupted{};
  }
}

auto MockGPIO::get_state(port_id_t p) -> std::optional<GPIOState> {
  std::lock_guard lock{m_mutex};
  if (auto it = m_gpios.find(p); it != m_gpios.end()) {
    return it->second;
  }
  return {};
}
