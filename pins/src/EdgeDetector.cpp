// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <EdgeDetector.hpp>
#include <PinErrors.hpp>

#include <exception>
#include <iostream>
#include <utility>

#include <fmt/format.h>

EdgeDetector::EdgeDetector(IGPIO::Ptr gpio, IGPIO::port_id_t port,
                           std::string name)
    : m_gpio{std::move(gpio)}, m_port{port}, m_name{std::move(name)} {}

EdgeDetector::~EdgeDetector() {
  if (armed()) {
    try {
      set_callback(nullptr);
    } catch (std::exception const &e) {
      std::cerr << fmt::format("Warning: {}\n", e.what());
    }
  }
}

auto EdgeDetector::callback() const -> Callback {
  std::lock_guard lock{m_mutex};
  return m_callback;
}

void EdgeDetector::set_callback(Callback callback) {
  std::unique_lock lock{m_mutex};
  const bool attached = static_cast<bool>(m_callback);
  if (attached && callback) {
    m_callback = std::move(callback);
    return;
  }
  if (!attached && !callback) {
    return;
  }
  m_callback = std::move(callback);
  lock.unlock();
  if (attached) {
    disarm();
  } else {
    arm();
  }
}

Edges EdgeDetector::edges() const {
  std::lock_guard lock{m_mutex};
  return m_edges;
}

void EdgeDetector::set_edges(Edges edges) {
  std::lock_guard lock{m_mutex};
  m_edges = edges;
}

auto EdgeDetector::bounce() const -> Bounce {
  std::lock_guard lock{m_mutex};
  return m_bounce;
}

void EdgeDetector::set_bounce(Bounce bounce) {
  std::lock_guard lock{m_mutex};
  m_bounce = bounce;
}

bool EdgeDetector::armed() const {
  std::lock_guard lock{m_mutex};
  return m_armed;
}

void EdgeDetector::arm() {
  std::unique_lock lock{m_mutex};
  const auto edge = to_hw(m_edges).value();
  m_last_delivered.reset();
  m_armed = true;
  lock.unlock();
  try {
    m_gpio->add_event_detect(
        m_port, edge, [this](IGPIO::Event const &event) { dispatch(event); });
  } catch (IGPIO::Error const &e) {
    lock.lock();
    m_armed = false;
    m_callback = nullptr;
    throw PinEdgeDetectFailed(fmt::format(
        "cannot enable edge detection on {}: {}", m_name, e.what()));
  }
}

void EdgeDetector::disarm() {
  {
    std::lock_guard lock{m_mutex};
    m_armed = false;
  }
  try {
    m_gpio->remove_event_detect(m_port);
  } catch (IGPIO::Error const &e) {
    throw PinEdgeDetectFailed(fmt::format(
        "cannot disable edge detection on {}: {}", m_name, e.what()));
  }
}

bool EdgeDetector::accepts(IGPIO::Event const &event) const {
  switch (m_edges) {
  case Edges::RISING:
    if (event.level == 0)
      return false;
    break;
  case Edges::FALLING:
    if (event.level != 0)
      return false;
    break;
  case Edges::BOTH:
    break;
  }
  if (m_bounce && m_last_delivered) {
    return event.timestamp - *m_last_delivered >= *m_bounce;
  }
  return true;
}

void EdgeDetector::dispatch(IGPIO::Event const &event) {
  std::lock_guard lock{m_mutex};
  if (!m_armed || !m_callback || !accepts(event)) {
    return;
  }
  m_last_delivered = event.timestamp;
  // the callback may replace itself
  auto callback = m_callback;
  try {
    callback(EdgeEvent{event.port, event.level != 0, event.timestamp});
  } catch (std::exception const &e) {
    std::cerr << fmt::format("Exception in edge callback of {}: {}\n", m_name,
                             e.what());
  }
}

EdgeDetector::Suspend::Suspend(EdgeDetector &detector)
    : m_detector{detector}, m_saved{detector.callback()},
      m_uncaught{std::uncaught_exceptions()} {
  m_detector.set_callback(nullptr);
}

EdgeDetector::Suspend::~Suspend() noexcept(false) {
  // Don't throw if there's already an exception in-flight
  if (std::uncaught_exceptions() > m_uncaught) {
    try {
      m_detector.set_callback(std::move(m_saved));
    } catch (std::exception const &e) {
      std::cerr << fmt::format("Warning: {}\n", e.what());
    }
    return;
  }
  m_detector.set_callback(std::move(m_saved));
}
