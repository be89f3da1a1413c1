// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>
#include <PinTypes.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

struct EdgeEvent {
  IGPIO::port_id_t port;
  bool state;
  std::chrono::nanoseconds timestamp;
};

// Forwards the backend's edge interrupts of one line to a user callback,
// filtered by edge direction and bounce time.
//
// The user callback is invoked on the backend's notification thread with the
// detector's lock held, so configuration changes wait for a running callback
// and a callback never sees a partially updated edges/bounce pair. The lock
// is recursive: the callback is free to reconfigure its own pin.
class EdgeDetector {
public:
  using Callback = std::function<void(EdgeEvent const &)>;
  using Bounce = std::optional<std::chrono::nanoseconds>;

  // Detaches the callback for the lifetime of the guard, then reattaches it
  // with whatever configuration is current at that point
  struct [[nodiscard]] Suspend {
    explicit Suspend(EdgeDetector &detector);
    Suspend(const Suspend &) = delete;
    Suspend &operator=(const Suspend &) = delete;
    ~Suspend() noexcept(false);

  private:
    EdgeDetector &m_detector;
    Callback m_saved;
    int m_uncaught;
  };

  EdgeDetector(IGPIO::Ptr gpio, IGPIO::port_id_t port, std::string name);
  EdgeDetector(const EdgeDetector &) = delete;
  EdgeDetector &operator=(const EdgeDetector &) = delete;
  ~EdgeDetector();

  [[nodiscard]] Callback callback() const;
  // Registers the interrupt on the first callback, unregisters on nullptr
  void set_callback(Callback callback);

  [[nodiscard]] Edges edges() const;
  void set_edges(Edges edges);
  [[nodiscard]] Bounce bounce() const;
  void set_bounce(Bounce bounce);

  [[nodiscard]] bool armed() const;

private:
  void arm();
  void disarm();
  void dispatch(IGPIO::Event const &event);
  bool accepts(IGPIO::Event const &event) const;

  IGPIO::Ptr m_gpio;
  const IGPIO::port_id_t m_port;
  const std::string m_name;

  mutable std::recursive_mutex m_mutex;
  Callback m_callback;
  Edges m_edges = Edges::BOTH;
  Bounce m_bounce;
  std::optional<std::chrono::nanoseconds> m_last_delivered;
  bool m_armed = false;
};
