#include "IGPIO.hpp"
#include "IPinInfo.hpp"
#include "MockGPIO.hpp"
#include "PinErrors.hpp"
#include "PinFactory.hpp"
#include <catch2/catch.hpp>

#include "test_utils.hpp"

#include <memory>
#include <stdexcept>

TEST_CASE("Factory creates one pin per port", "[PinFactory]") {
  auto [gpio, factory] = setup();

  auto pin = factory->pin(17);
  REQUIRE(pin);
  REQUIRE(factory->pin(17) == pin);
  REQUIRE(factory->pin(27) != pin);
  REQUIRE(pin->port() == 17);
  REQUIRE(gpio->get_state(17)->mode == IGPIO::Modes::INPUT);
}

TEST_CASE("Factory takes over the backend", "[PinFactory]") {
  SECTION("warnings are disabled") {
    auto [gpio, factory] = setup();
    REQUIRE_FALSE(gpio->warnings());
  }
  SECTION("line left claimed by a dead process is reused") {
    auto gpio = MockGPIO::Create();
    gpio->set_stale(5);
    PinFactory factory(gpio, test_pin_info());
    REQUIRE_NOTHROW(factory.pin(5));
    REQUIRE(factory.pin(5)->function() == Function::INPUT);
  }
  SECTION("line in use is reported and can be retried") {
    auto [gpio, factory] = setup();
    gpio->set_busy(6);
    REQUIRE_THROWS_AS(factory->pin(6), PinError);
    gpio->set_busy(6, false);
    REQUIRE(factory->pin(6)->function() == Function::INPUT);
  }
  SECTION("missing collaborators") {
    REQUIRE_THROWS_AS(PinFactory(nullptr, test_pin_info()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(PinFactory(MockGPIO::Create(), nullptr),
                      std::invalid_argument);
  }
  SECTION("default board information") {
    const auto info = IPinInfo::Create();
    REQUIRE(info->fixed_pull(2) == Pull::UP);
    REQUIRE(info->fixed_pull(3) == Pull::UP);
    REQUIRE_FALSE(info->fixed_pull(4).has_value());
  }
}

TEST_CASE("Factory close", "[PinFactory]") {
  auto [gpio, factory] = setup();
  auto output = factory->pin(20);
  output->set_function(Function::OUTPUT);
  output->set_frequency(100.0);
  auto input = factory->pin(21);
  input->set_when_changed([](EdgeEvent const &) {});

  SECTION("every pin is closed and the library released") {
    REQUIRE_FALSE(GPIOLibHandle::weak_instance().expired());
    factory->close();
    REQUIRE(factory->closed());
    REQUIRE(output->closed());
    REQUIRE(input->closed());
    REQUIRE(gpio->released());
    REQUIRE(GPIOLibHandle::weak_instance().expired());
    REQUIRE_FALSE(gpio->get_state(20)->pwm.has_value());
    REQUIRE_FALSE(gpio->get_state(21)->edge.has_value());
  }
  SECTION("close is idempotent") {
    factory->close();
    REQUIRE_NOTHROW(factory->close());
    REQUIRE(factory->closed());
    REQUIRE(gpio->released());
  }
  SECTION("no pins after close") {
    factory->close();
    REQUIRE_THROWS_AS(factory->pin(20), PinClosed);
    REQUIRE_THROWS_AS(factory->pin(4), PinClosed);
    REQUIRE_THROWS_AS(output->state(), PinClosed);
  }
}

TEST_CASE("Library initialised once per factory lifetime", "[PinFactory]") {
  const auto before = GPIOLibHandle::init_count();
  {
    auto [gpio, factory] = setup();
    factory->pin(4);
    factory->pin(5);
    REQUIRE(GPIOLibHandle::init_count() == before + 1);
    factory->close();
  }
  REQUIRE(GPIOLibHandle::weak_instance().expired());
  REQUIRE(GPIOLibHandle::init_count() == before + 1);
}
