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

#include "base/dura_t.hpp"
#include "base/types.hpp"


namespace homecast {

/// @brief Small footprint, lightweight class to measure the passage of time
///        since object construction
class Elapsed {
public:
  Elapsed(void) noexcept : nanos(monotonic()), frozen(false) {}

  /// @brief return the elapsed duration as an explicit type
  /// @tparam TO requested return type
  /// @return elapsed duration as requested type
  template <typename TO> inline TO as() const noexcept {
    if constexpr (IsDuration<TO>) {
      return std::chrono::duration_cast<TO>(elapsed());
    } else {
      static_assert(AlwaysFalse<TO>, "unsupported type");
    }
  }

  /// @brief Freeze the elapsed duration
  /// @return elapsed duration as std::chrono::nanoseconds
  Nanos freeze() noexcept {
    nanos = elapsed();
    frozen = true;
    return nanos;
  }

  /// @brief Create a humanized (e.g. 1min 20s 3.4ms) string of the elapsed duration
  /// @return const string
  const string humanize() const noexcept;

private:
  static Nanos monotonic() noexcept;
  Nanos elapsed() const noexcept { return frozen ? nanos : monotonic() - nanos; }

private:
  Nanos nanos;
  bool frozen;
};

} // namespace homecast
