// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <PinFactory.hpp>
#include <utils.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>

PinFactory::PinFactory(IGPIO::Ptr gpio, IPinInfo::Ptr info)
    : m_gpio{std::move(gpio)}, m_info{std::move(info)} {
  if (!m_gpio || !m_info) {
    throw std::invalid_argument("PinFactory requires a GPIO backend and pin "
                                "information");
  }
  // lines left claimed by a dead process are taken over silently
  m_gpio->set_warnings(false);
}

PinFactory::~PinFactory() {
  try {
    close();
  } catch (std::exception const &e) {
    std::cerr << fmt::format("Warning: failed to close pin factory: {}\n",
                             e.what());
  }
}

Pin::Ptr PinFactory::pin(port_id_t port) {
  std::lock_guard lock{m_mutex};
  if (!m_gpio) {
    throw PinClosed(
        fmt::format("pin factory is closed, can't create GPIO{}", port));
  }
  if (auto it = m_pins.find(port); it != m_pins.end()) {
    return it->second;
  }
  auto pin = std::make_shared<Pin>(m_gpio, port, m_info->fixed_pull(port));
  m_pins.emplace(port, pin);
  return pin;
}

void PinFactory::close() {
  std::lock_guard lock{m_mutex};
  if (!m_gpio) {
    return;
  }
  rg::for_each(m_pins | rgv::values, [](auto const &pin) { pin->close(); });
  m_pins.clear();
  m_gpio->cleanup();
  m_gpio.reset();
}

bool PinFactory::closed() const {
  std::lock_guard lock{m_mutex};
  return !m_gpio;
}
