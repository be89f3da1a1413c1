// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <PinTypes.hpp>

#include <type_traits>

#include <fmt/format.h>

namespace {

template <typename E> std::string describe(E value) {
  if (const auto name = name_of(value); name) {
    return std::string(*name);
  }
  return fmt::format("{}", static_cast<std::underlying_type_t<E>>(value));
}

struct AltFunction {
  IGPIO::port_id_t first;
  IGPIO::port_id_t last;
  IGPIO::Modes mode;
  Function function;
};

// BCM283x peripheral assignment of the header GPIOs
constexpr std::array alt_functions{
    AltFunction{0, 1, IGPIO::Modes::ALT0, Function::I2C},
    AltFunction{2, 3, IGPIO::Modes::ALT0, Function::I2C},
    AltFunction{7, 11, IGPIO::Modes::ALT0, Function::SPI},
    AltFunction{12, 13, IGPIO::Modes::ALT0, Function::PWM},
    AltFunction{14, 15, IGPIO::Modes::ALT0, Function::SERIAL},
    AltFunction{16, 21, IGPIO::Modes::ALT4, Function::SPI},
    AltFunction{18, 19, IGPIO::Modes::ALT5, Function::PWM},
};

} // namespace

std::string to_string(Function value) { return describe(value); }
std::string to_string(Pull value) { return describe(value); }
std::string to_string(Edges value) { return describe(value); }

Function function_from_mode(IGPIO::port_id_t port, IGPIO::Modes mode) {
  switch (mode) {
  case IGPIO::Modes::INPUT:
    return Function::INPUT;
  case IGPIO::Modes::OUTPUT:
    return Function::OUTPUT;
  case IGPIO::Modes::UNDEFINED:
    return Function::UNKNOWN;
  default:
    break;
  }
  auto it = rg::find_if(alt_functions, [port, mode](auto const &alt) {
    return alt.mode == mode && port >= alt.first && port <= alt.last;
  });
  return it != rg::end(alt_functions) ? it->function : Function::UNKNOWN;
}
