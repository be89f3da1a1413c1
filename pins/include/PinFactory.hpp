// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>
#include <IPinInfo.hpp>
#include <Pin.hpp>

#include <map>
#include <mutex>

// Owns the GPIO backend and at most one Pin per port
class PinFactory {
public:
  using port_id_t = IGPIO::port_id_t;

  [[nodiscard]] explicit PinFactory(IGPIO::Ptr gpio = IGPIO::Create(),
                                    IPinInfo::Ptr info = IPinInfo::Create());
  PinFactory(const PinFactory &) = delete;
  PinFactory &operator=(const PinFactory &) = delete;
  ~PinFactory();

  // Creates the pin on first use, the same instance is returned afterwards
  Pin::Ptr pin(port_id_t port);

  // Closes every pin then releases the backend. Idempotent.
  void close();
  [[nodiscard]] bool closed() const;

private:
  mutable std::mutex m_mutex;
  IGPIO::Ptr m_gpio;
  IPinInfo::Ptr m_info;
  std::map<port_id_t, Pin::Ptr> m_pins;
};
