// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include "PiGPIO.hpp"

#include <IGPIO.hpp>

#include <cmath>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fmt/format.h>

#include <iostream>
#include <limits>
#include <memory>
#include <pigpio.h>
#include <stdexcept>
#include <utility>
#include <vector>

#include <signal.h>

using Reason = IGPIO::Error::Reason;

namespace {
volatile sig_atomic_t s_interrupted = 0;

// duty cycle resolution, 0.01%
constexpr unsigned PWM_RANGE = 10000;

void catch_signals(int sig) {
  s_interrupted = 1;
  signal(sig, catch_signals);
}

Reason translate_error(int res) {
  switch (res) {
  case PI_BAD_LEVEL:
  case PI_BAD_PUD:
  case PI_BAD_MODE:
  case PI_BAD_DUTYCYCLE:
  case PI_BAD_DUTYRANGE:
    return Reason::InvalidValue;
  case PI_NOT_PERMITTED:
    return Reason::Busy;
  default:
    return Reason::Failure;
  }
}

template <typename... Args>
void check(int res, fmt::format_string<Args...> what, Args &&...args) {
  if (res < 0) {
    const auto msg = fmt::format(what, std::forward<Args>(args)...);
    throw IGPIO::Error(translate_error(res),
                       fmt::format("{} (error: {})", msg, res));
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

auto IGPIO::Create() -> Ptr { return std::make_shared<PiGPIO>(); }

unsigned int PiGPIO::translate_mode(Modes mode) {
  switch (mode) {
  case IGPIO::Modes::INPUT:
    return PI_INPUT;
  case IGPIO::Modes::OUTPUT:
    return PI_OUTPUT;
  case IGPIO::Modes::ALT0:
    return PI_ALT0;
  case IGPIO::Modes::ALT1:
    return PI_ALT1;
  case IGPIO::Modes::ALT2:
    return PI_ALT2;
  case IGPIO::Modes::ALT3:
    return PI_ALT3;
  case IGPIO::Modes::ALT4:
    return PI_ALT4;
  case IGPIO::Modes::ALT5:
    return PI_ALT5;
  default:
    break;
  }
  throw Error(Reason::InvalidValue,
              fmt::format("Can't translate mode {}", static_cast<int>(mode)));
}

auto PiGPIO::translate_mode(int mode) -> Modes {
  switch (mode) {
  case PI_INPUT:
    return Modes::INPUT;
  case PI_OUTPUT:
    return Modes::OUTPUT;
  case PI_ALT0:
    return Modes::ALT0;
  case PI_ALT1:
    return Modes::ALT1;
  case PI_ALT2:
    return Modes::ALT2;
  case PI_ALT3:
    return Modes::ALT3;
  case PI_ALT4:
    return Modes::ALT4;
  case PI_ALT5:
    return Modes::ALT5;
  default:
    return Modes::UNDEFINED;
  }
}

unsigned int PiGPIO::translate_pull(Pull pull) {
  switch (pull) {
  case Pull::OFF:
    return PI_PUD_OFF;
  case Pull::DOWN:
    return PI_PUD_DOWN;
  case Pull::UP:
    return PI_PUD_UP;
  }
  throw Error(Reason::InvalidValue,
              fmt::format("Can't translate pull {}", static_cast<int>(pull)));
}

unsigned int PiGPIO::translate_frequency(double frequency) {
  if (!(frequency >= 0.5 &&
        frequency < std::numeric_limits<unsigned int>::max())) {
    throw Error(Reason::InvalidValue,
                fmt::format("PWM frequency {} is out of range, pigpio "
                            "supports 1Hz and above",
                            frequency));
  }
  return static_cast<unsigned int>(std::lround(frequency));
}

void PiGPIO::ensure_initialized() const {
  if (!m_handle) {
    throw Error(Reason::Failure, "GPIO library not initialized");
  }
}

void PiGPIO::claim(port_id_t port) {
  if (m_claimed.contains(port)) {
    return;
  }
  if (m_warnings) {
    if (const auto mode = gpioGetMode(port);
        mode >= 0 && mode != PI_INPUT) {
      std::cerr << fmt::format("Warning: GPIO {} is already in use, "
                               "continuing anyway\n",
                               port);
    }
  }
  m_claimed.insert(port);
}

void PiGPIO::set_gpio_mode(port_id_t port, Modes mode, val_t initial) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  claim(port);
  check(gpioSetMode(port, translate_mode(mode)),
        "Failed to set GPIO mode {} on port {}", translate_mode(mode), port);
  if (mode == Modes::OUTPUT) {
    check(gpioSetPullUpDown(port, PI_PUD_OFF),
          "Failed to disable pull on port {}", port);
    check(gpioWrite(port, initial), "Failed to write {} on GPIO {}", initial,
          port);
  }
}

auto PiGPIO::gpio_mode(port_id_t port) -> Modes {
  ensure_running();
  ensure_initialized();
  const auto res = gpioGetMode(port);
  check(res, "Failed to get GPIO mode of port {}", port);
  return translate_mode(res);
}

void PiGPIO::set_pull(port_id_t port, Pull pull) {
  ensure_running();
  ensure_initialized();
  if (gpioGetMode(port) != PI_INPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("Trying to set pull on non-input GPIO {}", port));
  }
  check(gpioSetPullUpDown(port, translate_pull(pull)),
        "Failed to set pull on port {}", port);
}

void PiGPIO::gpio_write(port_id_t gpio, val_t val) {
  ensure_running();
  ensure_initialized();
  if (gpioGetMode(gpio) != PI_OUTPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("Trying to write non-output GPIO {}", gpio));
  }
  check(gpioWrite(gpio, val), "Failed to write {} on GPIO {}", val, gpio);
}

IGPIO::val_t PiGPIO::gpio_read(port_id_t gpio) {
  ensure_running();
  ensure_initialized();
  const auto res = gpioRead(gpio);
  check(res, "Failed to read on GPIO {}", gpio);
  return res;
}

void PiGPIO::pwm_start(port_id_t port, double frequency, double duty_cycle) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (gpioGetMode(port) != PI_OUTPUT) {
    throw Error(Reason::WrongDirection,
                fmt::format("GPIO {} must be set up as an output for PWM",
                            port));
  }
  if (m_pwm.contains(port)) {
    throw Error(Reason::Busy,
                fmt::format("PWM already running on GPIO {}", port));
  }
  const auto hz = translate_frequency(frequency);
  check(gpioSetPWMrange(port, PWM_RANGE), "Failed to set PWM range on GPIO {}",
        port);
  check(gpioSetPWMfrequency(port, hz),
        "Failed to set PWM frequency {} on GPIO {}", frequency, port);
  m_pwm.insert(port);
  pwm_set_duty_cycle(port, duty_cycle);
}

void PiGPIO::pwm_set_frequency(port_id_t port, double frequency) {
  ensure_running();
  ensure_initialized();
  check(gpioSetPWMfrequency(port, translate_frequency(frequency)),
        "Failed to set PWM frequency {} on GPIO {}", frequency, port);
}

void PiGPIO::pwm_set_duty_cycle(port_id_t port, double duty_cycle) {
  ensure_running();
  ensure_initialized();
  if (!(duty_cycle >= 0.0 && duty_cycle <= 100.0)) {
    throw Error(Reason::InvalidValue,
                fmt::format("Invalid duty cycle {}", duty_cycle));
  }
  const auto value = std::lround(duty_cycle * PWM_RANGE / 100.0);
  check(gpioPWM(port, value), "Failed to set duty cycle {} on GPIO {}",
        duty_cycle, port);
}

void PiGPIO::pwm_stop(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (m_pwm.erase(port)) {
    // dutycycle 0 switches PWM off, leaving the line low
    check(gpioPWM(port, 0), "Failed to stop PWM on GPIO {}", port);
  }
}

void PiGPIO::add_event_detect(port_id_t port, Edge edge,
                              EventCallback callback) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (m_alerts.contains(port)) {
    throw Error(Reason::Busy,
                fmt::format("Conflicting edge detection already enabled on "
                            "GPIO {}",
                            port));
  }
  m_alerts.emplace(port, Alert{edge, std::move(callback)});
  if (const auto res = gpioSetAlertFuncEx(port, &PiGPIO::on_alert, this);
      res < 0) {
    m_alerts.erase(port);
    check(res, "Failed to add edge detection on GPIO {}", port);
  }
}

void PiGPIO::remove_event_detect(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  if (m_alerts.erase(port)) {
    check(gpioSetAlertFuncEx(port, nullptr, nullptr),
          "Failed to remove edge detection on GPIO {}", port);
  }
}

void PiGPIO::on_alert(int gpio, int level, uint32_t tick, void *userdata) {
  if (level == PI_TIMEOUT) {
    return;
  }
  static_cast<PiGPIO *>(userdata)->dispatch(gpio, level, tick);
}

void PiGPIO::dispatch(port_id_t port, val_t level, uint32_t tick) {
  // Runs on the pigpio alert thread, holding the lock keeps
  // remove_event_detect() waiting for the callback to return
  std::lock_guard lock{m_mutex};
  if (tick < m_last_tick) {
    m_tick_epoch += uint64_t{1} << 32;
  }
  m_last_tick = tick;
  auto it = m_alerts.find(port);
  if (it == m_alerts.end() || !matches(it->second.edge, level)) {
    return;
  }
  auto callback = it->second.callback;
  const auto timestamp = std::chrono::microseconds(m_tick_epoch + tick);
  try {
    callback(Event{port, level, timestamp});
  } catch (std::exception const &e) {
    std::cerr << fmt::format("Exception in alert of GPIO {}: {}\n", port,
                             e.what());
  }
}

void PiGPIO::release(port_id_t port) {
  ensure_running();
  std::lock_guard lock{m_mutex};
  ensure_initialized();
  remove_event_detect(port);
  pwm_stop(port);
  check(gpioSetMode(port, PI_INPUT), "Failed to set GPIO {} as input", port);
  check(gpioSetPullUpDown(port, PI_PUD_OFF),
        "Failed to disable pull on port {}", port);
  m_claimed.erase(port);
}

void PiGPIO::cleanup() {
  std::lock_guard lock{m_mutex};
  if (!m_handle) {
    return;
  }
  const auto claimed = std::vector<port_id_t>(m_claimed.begin(), m_claimed.end());
  for (const auto port : claimed) {
    release(port);
  }
  m_handle.reset();
}

void PiGPIO::set_warnings(bool enabled) {
  std::lock_guard lock{m_mutex};
  m_warnings = enabled;
}

PiGPIO::PiGPIO() : m_handle(GPIOLibHandle::instance()) {}

GPIOLibHandle::GPIOLibHandle() {
  PiGPIO::ensure_running();
  // Pace the DMA with the PWM peripheral, the PCM clock interferes with the
  // I2S audio
  if (gpioCfgClock(5, PI_CLOCK_PWM, 0) < 0) {
    throw std::runtime_error("Failed to set clock source to PWM");
  }
  if (gpioInitialise() < 0) {
    throw std::runtime_error("Failed to initialize GPIO library");
  }
  initialized = true;
  terminated = false;
}

bool GPIOLibHandle::initialized{false};
bool GPIOLibHandle::terminated{false};

void GPIOLibHandle::terminate() {
  if (initialized && !terminated) {
    gpioTerminate();
    initialized = false;
    terminated = true;
  }
}

GPIOLibHandle::~GPIOLibHandle() { terminate(); }

GPIOLibHandle::Ref GPIOLibHandle::handle{};

void register_signal_handler(int sig, sighandler_t handler) {
  if (::signal(sig, handler) == SIG_ERR) {
    std::cerr << fmt::format("Warning: can't register signal handler for {}!\n",
                             sig);
  }
}

void GPIOLibHandle::atexit_cleanup() {
  if (auto p = weak_instance().lock(); p) {
    p->terminate();
  }
}

auto GPIOLibHandle::weak_instance() -> Ref { return handle; }
auto GPIOLibHandle::instance() -> Ptr {
  PiGPIO::ensure_running();

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

void PiGPIO::ensure_running() {
  // Don't throw if there's already an exception in-flight
  if (s_interrupted && std::uncaught_exceptions() == 0) {
    throw Interrupted{};
  }
}
