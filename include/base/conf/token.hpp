// homecast
// Copyright (C) 2026 The homecast Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include "base/conf/toml.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <concepts>
#include <cstdint>

namespace homecast {
namespace conf {

template <typename T>
concept IsConfRetVal = IsAnyOf<T, bool, string, double> || std::integral<T>;

/// @brief Provides access to configuration info using
///        the specified module id as the root.
///
///        conf::tokens are generally not used standalone.
///        Rather, they are member variables within an
///        object that requires access to the configuration.
///
///        The configuration data provided is current as of
///        the time of construction.
class token {
public:
  /// @brief Create a default token (does not point to a configuration)
  token() = default;

  /// @brief Create config token populated with the subtable at mid
  /// @param mid module_id (aka root)
  token(csv mid) noexcept;

  token(token &&) = default;
  token &operator=(token &&) = default;

public:
  /// @brief Is the configuration provided by this token empty?
  /// @return boolean
  bool empty() const noexcept { return ttable.empty(); }

  /// @brief Direct access to the configuration table managed by token
  const toml::table &table() const noexcept { return ttable; }

  /// @brief upper bound of timeout_val()
  static constexpr Millis max_timeout{Hours{24 * 365}};

  /// @brief Retrieve a "timeout" value from the config specified as:
  ///        lookup = { timeout = { mins = 5, secs = 30, millis = 100 } }
  /// @param p path to the config value (without the trailing timeout)
  /// @param def_val default duration
  /// @return std::chrono::milliseconds, at most max_timeout
  Millis timeout_val(csv p, Millis def_val) const noexcept;

  /// @brief Retrieve a scalar config value
  /// @tparam T return type
  /// @param p dotted path relative to the token root
  /// @param def_val returned when the path is missing or of another type
  template <typename T, typename D>
    requires IsConfRetVal<T>
  T val(csv p, D &&def_val) const noexcept {
    const auto node = ttable.at_path(p);

    if constexpr (std::same_as<T, string>) {
      return node.value_or(string(def_val));
    } else if constexpr (std::same_as<T, bool>) {
      return node.value_or(static_cast<bool>(def_val));
    } else if constexpr (std::same_as<T, double>) {
      return node.value_or(static_cast<double>(def_val));
    } else {
      return static_cast<T>(node.value_or(static_cast<int64_t>(def_val)));
    }
  }

public:
  // order dependent
  string root;

private:
  toml::table ttable;
};

} // namespace conf
} // namespace homecast
