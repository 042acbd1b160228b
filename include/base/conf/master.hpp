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
#include "base/types.hpp"

#include <filesystem>
#include <shared_mutex>

namespace homecast {
namespace conf {

/// @brief Process wide configuration parsed from a TOML file or string.
///
///        The master table is only read when a conf::token is constructed,
///        tokens keep a private copy of their module subtable.
class master {
public:
  master() = delete;

  /// @brief Parse a TOML file and merge it into the master table
  /// @param file path to TOML file
  /// @return boolean indicating success, see parse_error() on failure
  static bool parse_file(const std::filesystem::path &file) noexcept;

  /// @brief Parse TOML text and merge it into the master table
  /// @param text TOML document
  /// @return boolean indicating success, see parse_error() on failure
  static bool parse_string(csv text) noexcept;

  /// @brief Most recent parse error, empty when the last parse succeeded
  static string parse_error() noexcept;

  /// @brief Copy of the subtable at root (empty table when missing)
  static toml::table copy_subtable(csv root) noexcept;

  /// @brief Discard all configuration
  static void reset() noexcept;

private:
  static bool merge(toml::parse_result &&pr) noexcept;

private:
  static toml::table ttable;
  static string err_msg;
  static std::shared_mutex mtx;

public:
  MOD_ID("conf.master");
};

} // namespace conf
} // namespace homecast
