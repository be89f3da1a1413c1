// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <IPinInfo.hpp>

#include <memory>
#include <utility>

auto IPinInfo::Create() -> Ptr {
  // GPIO2 and GPIO3 (I2C1 SDA/SCL) carry 1.8k pull-ups on every 40-pin board
  return std::make_shared<StaticPinInfo>(
      StaticPinInfo::PullMap{{2, Pull::UP}, {3, Pull::UP}});
}

StaticPinInfo::StaticPinInfo(PullMap fixed_pulls)
    : m_fixed_pulls{std::move(fixed_pulls)} {}

std::optional<Pull> StaticPinInfo::fixed_pull(port_id_t port) const {
  if (auto it = m_fixed_pulls.find(port); it != m_fixed_pulls.end()) {
    return it->second;
  }
  return std::nullopt;
}
