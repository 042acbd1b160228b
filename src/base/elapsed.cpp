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

#include "base/elapsed.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>

namespace homecast {

Nanos Elapsed::monotonic() noexcept {
  return std::chrono::duration_cast<Nanos>(steady_clock::now().time_since_epoch());
}

const string Elapsed::humanize() const noexcept {
  using std::chrono::duration_cast;

  auto d = elapsed();

  string msg;
  auto w = std::back_inserter(msg);

  auto append = [&w](auto x) { fmt::format_to(w, "{} ", x); };

  if (auto x = duration_cast<Hours>(d); x != Hours::zero()) {
    append(x);
    d -= duration_cast<Nanos>(x);
  }

  if (auto x = duration_cast<Minutes>(d); x != Minutes::zero()) {
    append(x);
    d -= duration_cast<Nanos>(x);
  }

  if (auto x = duration_cast<Seconds>(d); x != Seconds::zero()) {
    append(x);
    d -= duration_cast<Nanos>(x);
  }

  if (auto ms = duration_cast<millis_fp>(d); ms > millis_fp::zero()) {
    fmt::format_to(w, "{:.2}", ms);
  } else {
    fmt::format_to(w, "0.0ms");
  }

  return msg;
}

} // namespace homecast
