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

#include "base/conf/token.hpp"
#include "base/conf/master.hpp"

#include <algorithm>

namespace homecast {
namespace conf {

token::token(csv mid) noexcept : root(mid), ttable(master::copy_subtable(mid)) {}

Millis token::timeout_val(csv p, Millis def_val) const noexcept {
  const auto *tt = ttable.at_path(p)["timeout"sv].as_table();

  if (tt == nullptr) return def_val;

  int64_t sum_ms{0};

  tt->for_each([&sum_ms](const toml::key &key, const toml::value<int64_t> &val) {
    int64_t unit_ms{0};

    if ((key == "minutes"sv) || (key == "mins"sv)) {
      unit_ms = Millis(Minutes{1}).count();
    } else if ((key == "seconds"sv) || (key == "secs"sv)) {
      unit_ms = Millis(Seconds{1}).count();
    } else if ((key == "millis"sv) || (key == "ms"sv)) {
      unit_ms = 1;
    }

    if (unit_ms == 0) return;

    // saturate at max_timeout, negative parts count as zero
    const auto v = std::clamp<int64_t>(val.get(), 0, max_timeout.count() / unit_ms);
    sum_ms = std::min(sum_ms + (v * unit_ms), max_timeout.count());
  });

  return Millis{sum_ms};
}

} // namespace conf
} // namespace homecast
