// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

struct IGPIO {
  using Ptr = std::shared_ptr<IGPIO>;

  struct Interrupted : std::exception {
    const char *what() const noexcept override { return "GPIO Interrupted"; }
  };

  // Raised by the backends for any refused hardware operation
  struct Error : std::runtime_error {
    enum class Reason {
      // value out of the domain accepted by the hardware
      InvalidValue,
      // operation not possible in the current line direction
      WrongDirection,
      // line or resource claimed by someone else
      Busy,
      Failure
    };
    Error(Reason reason, std::string const &msg)
        : std::runtime_error(msg), reason{reason} {}
    Reason reason;
  };

  enum class Modes {
    INPUT,
    OUTPUT,
    ALT0,
    ALT1,
    ALT2,
    ALT3,
    ALT4,
    ALT5,
    UNDEFINED
  };
  enum class Pull { OFF, DOWN, UP };
  enum class Edge { RISING, FALLING, BOTH };

  using port_id_t = unsigned;
  using val_t = unsigned;

  struct Event {
    port_id_t port;
    val_t level;
    // monotonic, only differences are meaningful
    std::chrono::nanoseconds timestamp;
  };
  using EventCallback = std::function<void(Event const &)>;

  // Switching to OUTPUT disables the pull resistor of the line
  virtual void set_gpio_mode(port_id_t port, Modes mode, val_t initial) = 0;
  void set_gpio_mode(port_id_t port, Modes mode) {
    set_gpio_mode(port, mode, 0);
  }
  virtual Modes gpio_mode(port_id_t port) = 0;
  virtual void set_pull(port_id_t port, Pull pull) = 0;

  virtual void gpio_write(port_id_t gpio, val_t val) = 0;
  virtual val_t gpio_read(port_id_t gpio) = 0;

  // Duty cycle is given in percent, [0, 100]
  virtual void pwm_start(port_id_t port, double frequency,
                         double duty_cycle) = 0;
  virtual void pwm_set_frequency(port_id_t port, double frequency) = 0;
  virtual void pwm_set_duty_cycle(port_id_t port, double duty_cycle) = 0;
  virtual void pwm_stop(port_id_t port) = 0;

  // The callback is invoked on the backend's notification thread, only for
  // the requested edges. No invocation starts after remove_event_detect()
  // returned.
  virtual void add_event_detect(port_id_t port, Edge edge,
                                EventCallback callback) = 0;
  virtual void remove_event_detect(port_id_t port) = 0;

  // Gives back a single line: stops PWM and event detection, then leaves the
  // line as a floating input
  virtual void release(port_id_t port) = 0;
  // Releases every line, then the process-wide library handle
  virtual void cleanup() = 0;
  virtual void set_warnings(bool enabled) = 0;

  static Ptr Create();

  virtual ~IGPIO() = default;
};
