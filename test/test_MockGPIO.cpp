#include "IGPIO.hpp"
#include "MockGPIO.hpp"
#include <catch2/catch.hpp>

#include "test_utils.hpp"

#include <stdexcept>
#include <vector>

using Modes = IGPIO::Modes;
using Reason = IGPIO::Error::Reason;

TEST_CASE("Mock lines", "[MockGPIO]") {
  auto gpio = MockGPIO::Create();

  SECTION("inputs read the pull unless driven") {
    gpio->set_gpio_mode(4, Modes::INPUT);
    REQUIRE(gpio->gpio_read(4) == 0);
    gpio->set_pull(4, IGPIO::Pull::UP);
    REQUIRE(gpio->gpio_read(4) == 1);
    gpio->drive(4, 0);
    REQUIRE(gpio->gpio_read(4) == 0);
  }
  SECTION("outputs latch the written level") {
    gpio->set_gpio_mode(4, Modes::OUTPUT, 1);
    REQUIRE(gpio->gpio_read(4) == 1);
    gpio->gpio_write(4, 0);
    REQUIRE(gpio->gpio_read(4) == 0);
    REQUIRE(error_reason([&] { gpio->gpio_write(4, 2); }) ==
            Reason::InvalidValue);
  }
  SECTION("switching to output disables the pull") {
    gpio->set_gpio_mode(4, Modes::INPUT);
    gpio->set_pull(4, IGPIO::Pull::DOWN);
    gpio->set_gpio_mode(4, Modes::OUTPUT);
    REQUIRE(gpio->get_state(4)->pull == IGPIO::Pull::OFF);
    REQUIRE(error_reason([&] { gpio->set_pull(4, IGPIO::Pull::UP); }) ==
            Reason::WrongDirection);
  }
  SECTION("inputs can't be written") {
    gpio->set_gpio_mode(4, Modes::INPUT);
    REQUIRE(error_reason([&] { gpio->gpio_write(4, 1); }) ==
            Reason::WrongDirection);
    REQUIRE(error_reason([&] { gpio->gpio_write(5, 1); }) ==
            Reason::WrongDirection);
  }
  SECTION("only inputs can be driven") {
    gpio->set_gpio_mode(4, Modes::OUTPUT);
    REQUIRE_THROWS_AS(gpio->drive(4, 1), std::logic_error);
  }
  SECTION("busy line") {
    gpio->set_busy(4);
    REQUIRE(error_reason([&] { gpio->set_gpio_mode(4, Modes::INPUT); }) ==
            Reason::Busy);
    gpio->set_busy(4, false);
    REQUIRE_NOTHROW(gpio->set_gpio_mode(4, Modes::INPUT));
  }
  SECTION("stale line is taken over with warnings disabled") {
    gpio->set_stale(4);
    REQUIRE(error_reason([&] { gpio->set_gpio_mode(4, Modes::INPUT); }) ==
            Reason::Busy);
    gpio->set_warnings(false);
    REQUIRE_NOTHROW(gpio->set_gpio_mode(4, Modes::INPUT));
    REQUIRE(gpio->gpio_mode(4) == Modes::INPUT);
  }
  SECTION("unknown line has no mode") {
    REQUIRE(gpio->gpio_mode(21) == Modes::UNDEFINED);
  }
}

TEST_CASE("Mock PWM", "[MockGPIO]") {
  auto gpio = MockGPIO::Create();
  gpio->set_gpio_mode(18, Modes::INPUT);

  REQUIRE(error_reason([&] { gpio->pwm_start(18, 100.0, 0.0); }) ==
          Reason::WrongDirection);

  gpio->set_gpio_mode(18, Modes::OUTPUT, 1);
  gpio->pwm_start(18, 100.0, 25.0);
  auto pwm = gpio->get_state(18)->pwm;
  REQUIRE(pwm.has_value());
  REQUIRE(pwm->frequency == 100.0);
  REQUIRE(pwm->duty_cycle == 25.0);

  REQUIRE(error_reason([&] { gpio->pwm_start(18, 100.0, 0.0); }) ==
          Reason::Busy);
  REQUIRE(error_reason([&] { gpio->pwm_set_duty_cycle(18, 101.0); }) ==
          Reason::InvalidValue);
  REQUIRE(error_reason([&] { gpio->pwm_set_frequency(18, 0.0); }) ==
          Reason::InvalidValue);

  gpio->pwm_set_frequency(18, 50.0);
  REQUIRE(gpio->get_state(18)->pwm->frequency == 50.0);

  gpio->pwm_stop(18);
  REQUIRE_FALSE(gpio->get_state(18)->pwm.has_value());
  REQUIRE(gpio->gpio_read(18) == 0);
  REQUIRE(error_reason([&] { gpio->pwm_set_duty_cycle(18, 50.0); }) ==
          Reason::Failure);
}

TEST_CASE("Mock edge detection", "[MockGPIO]") {
  auto gpio = MockGPIO::Create();
  gpio->set_gpio_mode(17, Modes::INPUT);
  std::vector<IGPIO::Event> events;

  gpio->add_event_detect(17, IGPIO::Edge::RISING,
                         [&](IGPIO::Event const &e) { events.push_back(e); });
  REQUIRE(gpio->event_registrations(17) == 1);
  REQUIRE(error_reason([&] {
            gpio->add_event_detect(17, IGPIO::Edge::BOTH,
                                   [](IGPIO::Event const &) {});
          }) == Reason::Busy);

  gpio->drive(17, 1, 100ns);
  gpio->drive(17, 1, 200ns);
  gpio->drive(17, 0, 300ns);
  gpio->drive(17, 1, 400ns);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].level == 1);
  REQUIRE(events[0].timestamp == 100ns);
  REQUIRE(events[1].timestamp == 400ns);

  gpio->remove_event_detect(17);
  gpio->drive(17, 0, 500ns);
  gpio->drive(17, 1, 600ns);
  REQUIRE(events.size() == 2);

  gpio->set_fail_event_detect(true);
  REQUIRE(error_reason([&] {
            gpio->add_event_detect(17, IGPIO::Edge::BOTH,
                                   [](IGPIO::Event const &) {});
          }) == Reason::Busy);
}

TEST_CASE("Mock release and cleanup", "[MockGPIO]") {
  auto gpio = MockGPIO::Create();
  gpio->set_gpio_mode(22, Modes::OUTPUT, 1);
  gpio->pwm_start(22, 10.0, 50.0);
  gpio->set_gpio_mode(23, Modes::INPUT);
  gpio->set_pull(23, IGPIO::Pull::UP);
  gpio->add_event_detect(23, IGPIO::Edge::BOTH, [](IGPIO::Event const &) {});

  gpio->release(22);
  const auto released = gpio->get_state(22).value();
  REQUIRE(released.mode == Modes::INPUT);
  REQUIRE(released.pull == IGPIO::Pull::OFF);
  REQUIRE_FALSE(released.pwm.has_value());

  REQUIRE_FALSE(gpio->released());
  gpio->cleanup();
  REQUIRE(gpio->released());
  REQUIRE_FALSE(gpio->get_state(23)->edge.has_value());
  REQUIRE(gpio->get_state(23)->pull == IGPIO::Pull::OFF);
  REQUIRE(error_reason([&] { gpio->gpio_read(23); }) == Reason::Failure);
  REQUIRE_NOTHROW(gpio->cleanup());
}
