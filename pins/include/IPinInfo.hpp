// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>
#include <PinTypes.hpp>

#include <map>
#include <memory>
#include <optional>

// Board data consulted by the factory, never modified
struct IPinInfo {
  using Ptr = std::shared_ptr<const IPinInfo>;
  using port_id_t = IGPIO::port_id_t;

  // Direction of the physical pull resistor wired to the pin, if any
  virtual std::optional<Pull> fixed_pull(port_id_t port) const = 0;

  // Raspberry Pi 40-pin header
  static Ptr Create();

  virtual ~IPinInfo() = default;
};

struct StaticPinInfo : public IPinInfo {
  using PullMap = std::map<port_id_t, Pull>;

  explicit StaticPinInfo(PullMap fixed_pulls = {});

  std::optional<Pull> fixed_pull(port_id_t port) const override;

private:
  PullMap m_fixed_pulls;
};
