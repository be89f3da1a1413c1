// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <utils.hpp>

// Only INPUT and OUTPUT are settable, the rest is reported by readback
enum class Function { INPUT, OUTPUT, I2C, SPI, PWM, SERIAL, UNKNOWN };
enum class Pull { UP, DOWN, FLOATING };
enum class Edges { BOTH, RISING, FALLING };

template <typename E> struct enum_names;

template <> struct enum_names<Function> {
  static constexpr std::array value{
      std::pair{Function::INPUT, "input"sv},
      std::pair{Function::OUTPUT, "output"sv},
      std::pair{Function::I2C, "i2c"sv},
      std::pair{Function::SPI, "spi"sv},
      std::pair{Function::PWM, "pwm"sv},
      std::pair{Function::SERIAL, "serial"sv},
      std::pair{Function::UNKNOWN, "unknown"sv},
  };
};

template <> struct enum_names<Pull> {
  static constexpr std::array value{
      std::pair{Pull::UP, "up"sv},
      std::pair{Pull::DOWN, "down"sv},
      std::pair{Pull::FLOATING, "floating"sv},
  };
};

template <> struct enum_names<Edges> {
  static constexpr std::array value{
      std::pair{Edges::BOTH, "both"sv},
      std::pair{Edges::RISING, "rising"sv},
      std::pair{Edges::FALLING, "falling"sv},
  };
};

// Hardware side of the same enumerations
template <typename E> struct hw_values;

template <> struct hw_values<Pull> {
  static constexpr std::array value{
      std::pair{Pull::UP, IGPIO::Pull::UP},
      std::pair{Pull::DOWN, IGPIO::Pull::DOWN},
      std::pair{Pull::FLOATING, IGPIO::Pull::OFF},
  };
};

template <> struct hw_values<Edges> {
  static constexpr std::array value{
      std::pair{Edges::BOTH, IGPIO::Edge::BOTH},
      std::pair{Edges::RISING, IGPIO::Edge::RISING},
      std::pair{Edges::FALLING, IGPIO::Edge::FALLING},
  };
};

template <typename E> bool is_valid(E value) {
  return lookup_second(enum_names<E>::value, value).has_value();
}

template <typename E> std::optional<std::string_view> name_of(E value) {
  return lookup_second(enum_names<E>::value, value);
}

template <typename E> std::optional<E> value_of(std::string_view name) {
  return lookup_first(enum_names<E>::value, name);
}

template <typename E> auto to_hw(E value) {
  return lookup_second(hw_values<E>::value, value);
}

template <typename E, typename H> std::optional<E> from_hw(H value) {
  return lookup_first(hw_values<E>::value, value);
}

// Name of the value, or its numeric representation when out of range
std::string to_string(Function value);
std::string to_string(Pull value);
std::string to_string(Edges value);

// Interprets an ALT mode of a BCM GPIO the way the SoC assigns them
Function function_from_mode(IGPIO::port_id_t port, IGPIO::Modes mode);
