#include <IGPIO.hpp>
#include <PinTypes.hpp>
#include <catch2/catch.hpp>

TEST_CASE("Names of the enumerations", "[PinTypes]") {
  SECTION("known values") {
    REQUIRE(to_string(Function::INPUT) == "input");
    REQUIRE(to_string(Function::I2C) == "i2c");
    REQUIRE(to_string(Function::UNKNOWN) == "unknown");
    REQUIRE(to_string(Pull::FLOATING) == "floating");
    REQUIRE(to_string(Edges::FALLING) == "falling");
  }
  SECTION("out of range values print as numbers") {
    REQUIRE(to_string(static_cast<Pull>(9)) == "9");
    REQUIRE(to_string(static_cast<Edges>(42)) == "42");
    REQUIRE_FALSE(is_valid(static_cast<Function>(100)));
  }
  SECTION("parsing") {
    REQUIRE(value_of<Edges>("rising") == Edges::RISING);
    REQUIRE(value_of<Pull>("up") == Pull::UP);
    REQUIRE(value_of<Function>("serial") == Function::SERIAL);
    REQUIRE_FALSE(value_of<Edges>("Rising").has_value());
    REQUIRE_FALSE(value_of<Pull>("").has_value());
  }
  SECTION("every name parses back to its value") {
    for (const auto &[value, name] : enum_names<Function>::value) {
      REQUIRE(value_of<Function>(name) == value);
    }
    for (const auto &[value, name] : enum_names<Pull>::value) {
      REQUIRE(value_of<Pull>(name) == value);
    }
    for (const auto &[value, name] : enum_names<Edges>::value) {
      REQUIRE(value_of<Edges>(name) == value);
    }
  }
}

TEST_CASE("Hardware values", "[PinTypes]") {
  REQUIRE(to_hw(Pull::FLOATING) == IGPIO::Pull::OFF);
  REQUIRE(to_hw(Pull::DOWN) == IGPIO::Pull::DOWN);
  REQUIRE(to_hw(Edges::BOTH) == IGPIO::Edge::BOTH);
  REQUIRE(from_hw<Pull>(IGPIO::Pull::UP) == Pull::UP);
  REQUIRE(from_hw<Edges>(IGPIO::Edge::FALLING) == Edges::FALLING);
  REQUIRE_FALSE(to_hw(static_cast<Pull>(7)).has_value());
}

TEST_CASE("Function readback of hardware modes", "[PinTypes]") {
  using Modes = IGPIO::Modes;
  REQUIRE(function_from_mode(4, Modes::INPUT) == Function::INPUT);
  REQUIRE(function_from_mode(4, Modes::OUTPUT) == Function::OUTPUT);
  REQUIRE(function_from_mode(2, Modes::ALT0) == Function::I2C);
  REQUIRE(function_from_mode(3, Modes::ALT0) == Function::I2C);
  REQUIRE(function_from_mode(10, Modes::ALT0) == Function::SPI);
  REQUIRE(function_from_mode(13, Modes::ALT0) == Function::PWM);
  REQUIRE(function_from_mode(14, Modes::ALT0) == Function::SERIAL);
  REQUIRE(function_from_mode(20, Modes::ALT4) == Function::SPI);
  REQUIRE(function_from_mode(18, Modes::ALT5) == Function::PWM);
  REQUIRE(function_from_mode(19, Modes::ALT5) == Function::PWM);
  REQUIRE(function_from_mode(18, Modes::ALT0) == Function::UNKNOWN);
  REQUIRE(function_from_mode(19, Modes::ALT0) == Function::UNKNOWN);
  REQUIRE(function_from_mode(4, Modes::ALT0) == Function::UNKNOWN);
  REQUIRE(function_from_mode(14, Modes::ALT3) == Function::UNKNOWN);
  REQUIRE(function_from_mode(5, Modes::UNDEFINED) == Function::UNKNOWN);
}
