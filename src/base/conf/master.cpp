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

#include "base/conf/master.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <mutex>

namespace homecast {
namespace conf {

toml::table master::ttable;
string master::err_msg;
std::shared_mutex master::mtx;

bool master::parse_file(const std::filesystem::path &file) noexcept {
  try {
    return merge(toml::parse_file(file.string()));
  } catch (const toml::parse_error &err) {
    std::unique_lock lck(mtx);
    err_msg = fmt::format("{} parse failed: {}", file, err.description());
  }

  return false;
}

bool master::parse_string(csv text) noexcept {
  try {
    return merge(toml::parse(text));
  } catch (const toml::parse_error &err) {
    std::unique_lock lck(mtx);
    err_msg = fmt::format("<string> parse failed: {}", err.description());
  }

  return false;
}

string master::parse_error() noexcept {
  std::shared_lock lck(mtx);

  return err_msg;
}

toml::table master::copy_subtable(csv root) noexcept {
  std::shared_lock lck(mtx);

  if (auto *t = ttable[root].as_table(); t != nullptr) return *t;

  return toml::table();
}

void master::reset() noexcept {
  std::unique_lock lck(mtx);

  ttable.clear();
  err_msg.clear();
}

bool master::merge(toml::parse_result &&pr) noexcept {
  std::unique_lock lck(mtx);

  // merge the parsed config to our table, top level keys replace existing keys
  pr.for_each([](const toml::key &key, auto &&val) { ttable.insert_or_assign(key, val); });

  err_msg.clear();

  return true;
}

} // namespace conf
} // namespace homecast
