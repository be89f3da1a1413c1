#include "EdgeDetector.hpp"
#include "IGPIO.hpp"
#include "MockGPIO.hpp"
#include "PinErrors.hpp"
#include <catch2/catch.hpp>

#include "test_utils.hpp"

#include <stdexcept>
#include <vector>

namespace {
struct DetectorObjects {
  DetectorObjects() : gpio(MockGPIO::Create()) {
    gpio->set_gpio_mode(port, IGPIO::Modes::INPUT);
  }
  static constexpr IGPIO::port_id_t port = 4;
  std::shared_ptr<MockGPIO> gpio;
  std::vector<EdgeEvent> events;

  auto recorder() {
    return [this](EdgeEvent const &e) { events.push_back(e); };
  }
};
} // namespace

TEST_CASE("Attaching and detaching the callback", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");
  REQUIRE_FALSE(detector.armed());

  detector.set_callback(objs.recorder());
  REQUIRE(detector.armed());
  REQUIRE(gpio->get_state(objs.port)->edge == IGPIO::Edge::BOTH);
  REQUIRE(gpio->event_registrations(objs.port) == 1);

  SECTION("replacing the callback keeps the registration") {
    int replaced = 0;
    detector.set_callback([&replaced](EdgeEvent const &) { ++replaced; });
    REQUIRE(gpio->event_registrations(objs.port) == 1);
    gpio->drive(objs.port, 1, 1ms);
    REQUIRE(replaced == 1);
    REQUIRE(objs.events.empty());
  }
  SECTION("events carry the new level") {
    gpio->drive(objs.port, 1, 1ms);
    gpio->drive(objs.port, 0, 2ms);
    REQUIRE(objs.events.size() == 2);
    REQUIRE(objs.events[0].port == objs.port);
    REQUIRE(objs.events[0].state);
    REQUIRE_FALSE(objs.events[1].state);
    REQUIRE(objs.events[1].timestamp == 2ms);
  }
  SECTION("detaching unregisters") {
    detector.set_callback(nullptr);
    REQUIRE_FALSE(detector.armed());
    REQUIRE_FALSE(gpio->get_state(objs.port)->edge.has_value());
    gpio->drive(objs.port, 1, 1ms);
    REQUIRE(objs.events.empty());
  }
  SECTION("destruction unregisters") {
    {
      EdgeDetector other(gpio, 5, "GPIO5");
      gpio->set_gpio_mode(5, IGPIO::Modes::INPUT);
      other.set_callback(objs.recorder());
      REQUIRE(gpio->get_state(5)->edge.has_value());
    }
    REQUIRE_FALSE(gpio->get_state(5)->edge.has_value());
  }
}

TEST_CASE("Edge filter", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");
  detector.set_callback(objs.recorder());

  SECTION("rising only") {
    detector.set_edges(Edges::RISING);
    gpio->drive(objs.port, 1, 1ms);
    gpio->drive(objs.port, 0, 2ms);
    gpio->drive(objs.port, 1, 3ms);
    REQUIRE(objs.events.size() == 2);
    REQUIRE(objs.events[0].state);
    REQUIRE(objs.events[1].state);
  }
  SECTION("falling only") {
    detector.set_edges(Edges::FALLING);
    gpio->drive(objs.port, 1, 1ms);
    gpio->drive(objs.port, 0, 2ms);
    REQUIRE(objs.events.size() == 1);
    REQUIRE_FALSE(objs.events[0].state);
  }
}

TEST_CASE("Debounce", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");

  SECTION("edges within the bounce time of the last delivered are dropped") {
    detector.set_bounce(100ms);
    detector.set_callback(objs.recorder());
    gpio->drive(objs.port, 1, 1000ms);
    gpio->drive(objs.port, 0, 1050ms);
    gpio->drive(objs.port, 1, 1099ms);
    gpio->drive(objs.port, 0, 1100ms);
    gpio->drive(objs.port, 1, 1150ms);
    REQUIRE(objs.events.size() == 2);
    REQUIRE(objs.events[0].timestamp == 1000ms);
    REQUIRE(objs.events[1].timestamp == 1100ms);
  }
  SECTION("zero bounce doesn't filter") {
    detector.set_bounce(0ns);
    detector.set_callback(objs.recorder());
    gpio->drive(objs.port, 1, 5ms);
    gpio->drive(objs.port, 0, 5ms);
    gpio->drive(objs.port, 1, 5ms);
    REQUIRE(objs.events.size() == 3);
  }
  SECTION("no bounce doesn't filter") {
    detector.set_bounce(std::nullopt);
    detector.set_callback(objs.recorder());
    gpio->drive(objs.port, 1, 5ms);
    gpio->drive(objs.port, 0, 5ms);
    REQUIRE(objs.events.size() == 2);
  }
  SECTION("rearming forgets the last delivered edge") {
    detector.set_bounce(100ms);
    detector.set_callback(objs.recorder());
    gpio->drive(objs.port, 1, 1000ms);
    detector.set_callback(nullptr);
    detector.set_callback(objs.recorder());
    gpio->drive(objs.port, 0, 1010ms);
    REQUIRE(objs.events.size() == 2);
  }
}

TEST_CASE("Suspending the callback", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");

  SECTION("the callback is restored with the new configuration") {
    detector.set_callback(objs.recorder());
    {
      EdgeDetector::Suspend suspended{detector};
      REQUIRE_FALSE(detector.armed());
      REQUIRE_FALSE(detector.callback());
      REQUIRE_FALSE(gpio->get_state(objs.port)->edge.has_value());
      detector.set_edges(Edges::FALLING);
    }
    REQUIRE(detector.armed());
    REQUIRE(detector.callback());
    REQUIRE(gpio->event_registrations(objs.port) == 2);
    REQUIRE(gpio->get_state(objs.port)->edge == IGPIO::Edge::FALLING);
  }
  SECTION("nothing is attached without a callback") {
    {
      EdgeDetector::Suspend suspended{detector};
      detector.set_bounce(10ms);
    }
    REQUIRE_FALSE(detector.armed());
    REQUIRE(gpio->event_registrations(objs.port) == 0);
    REQUIRE(detector.bounce() == 10ms);
  }
  SECTION("the callback is restored when the update fails") {
    detector.set_callback(objs.recorder());
    REQUIRE_THROWS_AS(
        [&] {
          EdgeDetector::Suspend suspended{detector};
          throw std::runtime_error("update failed");
        }(),
        std::runtime_error);
    REQUIRE(detector.armed());
    gpio->drive(objs.port, 1, 1ms);
    REQUIRE(objs.events.size() == 1);
  }
  SECTION("a refused reattach is reported") {
    detector.set_callback(objs.recorder());
    REQUIRE_THROWS_AS(
        [&] {
          EdgeDetector::Suspend suspended{detector};
          gpio->set_fail_event_detect(true);
        }(),
        PinEdgeDetectFailed);
    REQUIRE_FALSE(detector.armed());
    REQUIRE_FALSE(detector.callback());
  }
  SECTION("a refused reattach doesn't mask the failed update") {
    detector.set_callback(objs.recorder());
    REQUIRE_THROWS_AS(
        [&] {
          EdgeDetector::Suspend suspended{detector};
          gpio->set_fail_event_detect(true);
          throw std::invalid_argument("update failed");
        }(),
        std::invalid_argument);
    REQUIRE_FALSE(detector.armed());
  }
}

TEST_CASE("Refused registration", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");
  gpio->set_fail_event_detect(true);
  REQUIRE_THROWS_AS(detector.set_callback(objs.recorder()),
                    PinEdgeDetectFailed);
  REQUIRE_FALSE(detector.armed());
  REQUIRE_FALSE(detector.callback());

  gpio->set_fail_event_detect(false);
  REQUIRE_NOTHROW(detector.set_callback(objs.recorder()));
  REQUIRE(detector.armed());
}

TEST_CASE("Exceptions of the callback are contained", "[EdgeDetector]") {
  DetectorObjects objs;
  auto &gpio = objs.gpio;
  EdgeDetector detector(gpio, objs.port, "GPIO4");
  int calls = 0;
  detector.set_callback([&calls](EdgeEvent const &) {
    ++calls;
    throw std::runtime_error("callback failed");
  });
  REQUIRE_NOTHROW(gpio->drive(objs.port, 1, 1ms));
  REQUIRE_NOTHROW(gpio->drive(objs.port, 0, 2ms));
  REQUIRE(calls == 2);
  REQUIRE(detector.armed());
}
