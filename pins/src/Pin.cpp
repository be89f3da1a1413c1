// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <Pin.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

Pin::Pin(IGPIO::Ptr gpio, port_id_t port, std::optional<Pull> fixed_pull)
    : m_gpio{std::move(gpio)}, m_port{port},
      m_name{fmt::format("GPIO{}", port)}, m_fixed_pull{fixed_pull},
      m_pull{fixed_pull.value_or(Pull::FLOATING)}, m_input_pull{m_pull},
      m_detector{m_gpio, port, m_name} {
  if (!m_gpio) {
    throw std::invalid_argument("Pin requires a GPIO backend");
  }
  try {
    m_gpio->set_gpio_mode(m_port, IGPIO::Modes::INPUT);
  } catch (IGPIO::Error const &e) {
    throw PinError(fmt::format("cannot claim {}: {}", m_name, e.what()));
  }
  try {
    m_gpio->set_pull(m_port, to_hw(m_pull).value());
  } catch (IGPIO::Error const &e) {
    // the destructor won't run, give the line back here
    try {
      m_gpio->release(m_port);
    } catch (IGPIO::Error const &release_error) {
      std::cerr << fmt::format("Warning: failed to release {}: {}\n", m_name,
                               release_error.what());
    }
    throw PinError(fmt::format("cannot set up pull of {}: {}", m_name,
                               e.what()));
  }
}

Pin::~Pin() {
  try {
    close();
  } catch (std::exception const &e) {
    std::cerr << fmt::format("Warning: failed to close {}: {}\n", m_name,
                             e.what());
  }
}

void Pin::ensure_open() const {
  if (m_closed) {
    throw PinClosed(fmt::format("{} is closed", m_name));
  }
}

Function Pin::function() const {
  ensure_open();
  try {
    return function_from_mode(m_port, m_gpio->gpio_mode(m_port));
  } catch (IGPIO::Error const &e) {
    throw PinInvalidFunction(
        fmt::format("cannot read function of {}: {}", m_name, e.what()));
  }
}

void Pin::set_function(Function value) {
  ensure_open();
  if (value != Function::INPUT && value != Function::OUTPUT) {
    throw PinInvalidFunction(fmt::format(R"(invalid function "{}" for pin {})",
                                         to_string(value), m_name));
  }
  if (value == Function::INPUT && m_frequency) {
    stop_pwm();
  }
  try {
    if (value == Function::OUTPUT) {
      // an output with PWM running is left alone
      if (m_gpio->gpio_mode(m_port) != IGPIO::Modes::OUTPUT) {
        m_gpio->set_gpio_mode(m_port, IGPIO::Modes::OUTPUT, 0);
      }
      m_pull = Pull::FLOATING;
    } else {
      const auto pull = m_fixed_pull.value_or(m_input_pull);
      m_gpio->set_gpio_mode(m_port, IGPIO::Modes::INPUT);
      m_gpio->set_pull(m_port, to_hw(pull).value());
      m_pull = pull;
    }
  } catch (IGPIO::Error const &e) {
    throw PinError(fmt::format("cannot set function of {} to {}: {}", m_name,
                               to_string(value), e.what()));
  }
}

void Pin::set_function(std::string_view value) {
  const auto function = value_of<Function>(value);
  if (!function) {
    ensure_open();
    throw PinInvalidFunction(
        fmt::format(R"(invalid function "{}" for pin {})", value, m_name));
  }
  set_function(*function);
}

Pull Pin::pull() const {
  ensure_open();
  return m_pull;
}

void Pin::check_pull(std::optional<Pull> value, std::string_view text) const {
  if (function() != Function::INPUT) {
    throw PinFixedPull(
        fmt::format("cannot set pull on non-input pin {}", m_name));
  }
  if (m_fixed_pull && value != m_fixed_pull) {
    throw PinFixedPull(fmt::format("{} has a physical pull-{} resistor",
                                   m_name, to_string(*m_fixed_pull)));
  }
  if (!value || !is_valid(*value)) {
    throw PinInvalidPull(
        fmt::format(R"(invalid pull "{}" for pin {})", text, m_name));
  }
}

void Pin::set_pull(Pull value) {
  ensure_open();
  check_pull(value, to_string(value));
  try {
    m_gpio->set_pull(m_port, to_hw(value).value());
  } catch (IGPIO::Error const &e) {
    if (e.reason == IGPIO::Error::Reason::InvalidValue) {
      throw PinInvalidPull(fmt::format(R"(invalid pull "{}" for pin {}: {})",
                                       to_string(value), m_name, e.what()));
    }
    throw PinError(
        fmt::format("cannot set pull of {}: {}", m_name, e.what()));
  }
  m_pull = value;
  m_input_pull = value;
}

void Pin::set_pull(std::string_view value) {
  ensure_open();
  if (const auto pull = value_of<Pull>(value); pull) {
    set_pull(*pull);
  } else {
    check_pull(std::nullopt, value);
  }
}

double Pin::state() const {
  ensure_open();
  if (m_frequency) {
    return m_duty_cycle.value_or(0.0);
  }
  try {
    return m_gpio->gpio_read(m_port) ? 1.0 : 0.0;
  } catch (IGPIO::Error const &e) {
    throw PinError(
        fmt::format("cannot read state of {}: {}", m_name, e.what()));
  }
}

void Pin::set_state(double value) {
  ensure_open();
  if (m_frequency) {
    if (!(value >= 0.0 && value <= 1.0)) {
      throw PinInvalidState(
          fmt::format(R"(invalid state "{}" for pin {})", value, m_name));
    }
    try {
      m_gpio->pwm_set_duty_cycle(m_port, value * 100.0);
    } catch (IGPIO::Error const &e) {
      if (e.reason == IGPIO::Error::Reason::InvalidValue) {
        throw PinInvalidState(fmt::format(
            R"(invalid state "{}" for pin {}: {})", value, m_name, e.what()));
      }
      throw PinError(fmt::format("cannot set duty cycle of {}: {}", m_name,
                                 e.what()));
    }
    m_duty_cycle = value;
    return;
  }
  if (function() == Function::INPUT) {
    throw PinSetInput(fmt::format("cannot set state of pin {}", m_name));
  }
  if (value != 0.0 && value != 1.0) {
    throw PinInvalidState(
        fmt::format(R"(invalid state "{}" for pin {})", value, m_name));
  }
  try {
    m_gpio->gpio_write(m_port, value != 0.0 ? 1 : 0);
  } catch (IGPIO::Error const &e) {
    switch (e.reason) {
    case IGPIO::Error::Reason::WrongDirection:
      throw PinSetInput(
          fmt::format("cannot set state of pin {}: {}", m_name, e.what()));
    case IGPIO::Error::Reason::InvalidValue:
      throw PinInvalidState(fmt::format(
          R"(invalid state "{}" for pin {}: {})", value, m_name, e.what()));
    default:
      throw PinError(
          fmt::format("cannot set state of {}: {}", m_name, e.what()));
    }
  }
}

std::optional<double> Pin::frequency() const {
  ensure_open();
  return m_frequency;
}

void Pin::set_frequency(std::optional<double> value) {
  ensure_open();
  if (value && !(*value > 0.0)) {
    throw PinInvalidFrequency(
        fmt::format(R"(invalid frequency "{}" for pin {})", *value, m_name));
  }
  if (!m_frequency && value) {
    start_pwm(*value);
  } else if (m_frequency && value) {
    // same rate keeps running untouched, duty cycle included
    if (*value != *m_frequency) {
      try {
        m_gpio->pwm_set_frequency(m_port, *value);
      } catch (IGPIO::Error const &e) {
        if (e.reason == IGPIO::Error::Reason::InvalidValue) {
          throw PinInvalidFrequency(
              fmt::format(R"(invalid frequency "{}" for pin {}: {})", *value,
                          m_name, e.what()));
        }
        throw PinPWMFixedValue(fmt::format(
            "cannot change PWM frequency of {} to {}: {}", m_name, *value,
            e.what()));
      }
      m_frequency = value;
    }
  } else if (m_frequency && !value) {
    stop_pwm();
  }
}

void Pin::start_pwm(double frequency) {
  try {
    m_level_before_pwm = m_gpio->gpio_read(m_port);
    m_gpio->pwm_start(m_port, frequency, 0.0);
  } catch (IGPIO::Error const &e) {
    if (e.reason == IGPIO::Error::Reason::InvalidValue) {
      throw PinInvalidFrequency(
          fmt::format(R"(invalid frequency "{}" for pin {}: {})", frequency,
                      m_name, e.what()));
    }
    throw PinPWMFixedValue(
        fmt::format("cannot start PWM on pin {}: {}", m_name, e.what()));
  }
  m_duty_cycle = 0.0;
  m_frequency = frequency;
}

void Pin::stop_pwm() {
  try {
    m_gpio->pwm_stop(m_port);
  } catch (IGPIO::Error const &e) {
    throw PinError(
        fmt::format("cannot stop PWM on {}: {}", m_name, e.what()));
  }
  m_duty_cycle.reset();
  m_frequency.reset();
  try {
    m_gpio->gpio_write(m_port, m_level_before_pwm);
  } catch (IGPIO::Error const &e) {
    throw PinError(fmt::format("PWM stopped on {} but restoring level {} "
                               "failed: {}",
                               m_name, m_level_before_pwm, e.what()));
  }
}

auto Pin::bounce() const -> std::optional<seconds> {
  ensure_open();
  if (const auto bounce = m_detector.bounce(); bounce) {
    return seconds{*bounce};
  }
  return std::nullopt;
}

void Pin::set_bounce(std::optional<seconds> value) {
  ensure_open();
  if (value && !(value->count() >= 0.0)) {
    throw PinInvalidBounce(
        fmt::format("bounce must be 0 or greater, got {}s for pin {}",
                    value->count(), m_name));
  }
  // the debounce window is kept in nanoseconds
  if (value && !(*value < std::chrono::duration<double>(
                              std::chrono::nanoseconds::max()))) {
    throw PinInvalidBounce(fmt::format(
        "bounce must be below {}s, got {}s for pin {}",
        std::chrono::duration<double>(std::chrono::nanoseconds::max()).count(),
        value->count(), m_name));
  }
  EdgeDetector::Suspend suspended{m_detector};
  if (value) {
    m_detector.set_bounce(
        std::chrono::duration_cast<std::chrono::nanoseconds>(*value));
  } else {
    m_detector.set_bounce(std::nullopt);
  }
}

Edges Pin::edges() const {
  ensure_open();
  return m_detector.edges();
}

void Pin::set_edges(Edges value) {
  ensure_open();
  EdgeDetector::Suspend suspended{m_detector};
  if (!is_valid(value)) {
    throw PinInvalidEdges(fmt::format(R"(invalid edges "{}" for pin {})",
                                      to_string(value), m_name));
  }
  m_detector.set_edges(value);
}

void Pin::set_edges(std::string_view value) {
  ensure_open();
  const auto edges = value_of<Edges>(value);
  if (!edges) {
    throw PinInvalidEdges(
        fmt::format(R"(invalid edges "{}" for pin {})", value, m_name));
  }
  set_edges(*edges);
}

auto Pin::when_changed() const -> Callback {
  ensure_open();
  return m_detector.callback();
}

void Pin::set_when_changed(Callback callback) {
  ensure_open();
  m_detector.set_callback(std::move(callback));
}

void Pin::close() {
  if (m_closed) {
    return;
  }
  if (m_frequency) {
    stop_pwm();
  }
  m_detector.set_callback(nullptr);
  try {
    m_gpio->release(m_port);
  } catch (IGPIO::Error const &e) {
    throw PinError(fmt::format("cannot release {}: {}", m_name, e.what()));
  }
  m_closed = true;
}
