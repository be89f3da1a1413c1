// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <EdgeDetector.hpp>
#include <IGPIO.hpp>
#include <PinErrors.hpp>
#include <PinTypes.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// A single GPIO line. Every setter is a state transition which keeps
// function, pull, PWM and edge detection consistent with each other.
//
// In digital mode the state is 0 or 1, while a frequency is set the pin runs
// software PWM and the state is the duty cycle in [0, 1].
class Pin {
public:
  using Ptr = std::shared_ptr<Pin>;
  using port_id_t = IGPIO::port_id_t;
  using Callback = EdgeDetector::Callback;
  using seconds = std::chrono::duration<double>;

  // Claims the line as an input with the fixed pull, or floating
  Pin(IGPIO::Ptr gpio, port_id_t port, std::optional<Pull> fixed_pull = {});
  Pin(const Pin &) = delete;
  Pin &operator=(const Pin &) = delete;
  ~Pin();

  [[nodiscard]] port_id_t port() const noexcept { return m_port; }
  [[nodiscard]] std::string const &name() const noexcept { return m_name; }
  [[nodiscard]] std::optional<Pull> fixed_pull() const noexcept {
    return m_fixed_pull;
  }

  [[nodiscard]] Function function() const;
  void set_function(Function value);
  void set_function(std::string_view value);

  [[nodiscard]] Pull pull() const;
  void set_pull(Pull value);
  void set_pull(std::string_view value);

  [[nodiscard]] double state() const;
  void set_state(double value);

  [[nodiscard]] std::optional<double> frequency() const;
  void set_frequency(std::optional<double> value);

  [[nodiscard]] std::optional<seconds> bounce() const;
  void set_bounce(std::optional<seconds> value);

  [[nodiscard]] Edges edges() const;
  void set_edges(Edges value);
  void set_edges(std::string_view value);

  [[nodiscard]] Callback when_changed() const;
  void set_when_changed(Callback callback);

  // Stops PWM and edge detection and gives the line back. Safe to call more
  // than once; any other operation afterwards raises PinClosed.
  void close();
  [[nodiscard]] bool closed() const noexcept { return m_closed; }

private:
  void ensure_open() const;
  void start_pwm(double frequency);
  void stop_pwm();
  void check_pull(std::optional<Pull> value, std::string_view text) const;

  IGPIO::Ptr m_gpio;
  const port_id_t m_port;
  const std::string m_name;
  const std::optional<Pull> m_fixed_pull;

  Pull m_pull;
  // pull restored when switching back to input
  Pull m_input_pull;
  std::optional<double> m_frequency;
  std::optional<double> m_duty_cycle;
  IGPIO::val_t m_level_before_pwm = 0;
  EdgeDetector m_detector;
  bool m_closed = false;
};
