// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/view/map.hpp>

namespace rg = ranges;
namespace rgv = rg::views;

using std::literals::string_view_literals::operator""sv;

// Lookup in a fixed table of pairs, in either direction
template <typename Table, typename Key>
auto lookup_second(Table const &table, Key const &key)
    -> std::optional<typename Table::value_type::second_type> {
  if (auto it = rg::find_if(table,
                            [&key](auto const &e) { return e.first == key; });
      it != rg::end(table)) {
    return it->second;
  }
  return std::nullopt;
}

template <typename Table, typename Key>
auto lookup_first(Table const &table, Key const &key)
    -> std::optional<typename Table::value_type::first_type> {
  if (auto it = rg::find_if(table,
                            [&key](auto const &e) { return e.second == key; });
      it != rg::end(table)) {
    return it->first;
  }
  return std::nullopt;
}
