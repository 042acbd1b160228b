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
#include "base/error.hpp"

#include <algorithm>
#include <optional>
#include <stop_token>

namespace homecast {

/// @brief Execution context passed to every blocking operation.
///        Carries a stop_token for cancellation and an optional deadline.
///        Cheap to copy; copies observe the same stop source.
class CallCtx {
public:
  using time_point = steady_clock::time_point;

public:
  /// @brief Context that is never cancelled and never expires
  CallCtx() = default;

  CallCtx(std::stop_token stoken) noexcept : stoken(std::move(stoken)) {}

  CallCtx(Millis timeout, std::stop_token stoken = {}) noexcept
      : stoken(std::move(stoken)), deadline(steady_clock::now() + timeout) {}

  /// @brief Derive a context sharing our stop_token whose deadline is the
  ///        earlier of ours and now + timeout
  CallCtx child(Millis timeout) const noexcept {
    CallCtx ctx(timeout, stoken);

    if (deadline.has_value()) ctx.deadline = std::min(*deadline, *ctx.deadline);

    return ctx;
  }

  /// @brief Success when the operation may proceed, otherwise the
  ///        cancellation flavored error
  error_code check() const noexcept {
    if (stop_requested()) return make_error(errc::operation_canceled);
    if (expired()) return make_error(errc::timed_out);

    return make_error();
  }

  bool expired() const noexcept { return deadline && (steady_clock::now() >= *deadline); }

  bool has_deadline() const noexcept { return deadline.has_value(); }

  /// @brief Time remaining before the deadline, def_val when there is no deadline
  Millis remaining(Millis def_val) const noexcept {
    if (!deadline) return def_val;

    const auto left = std::chrono::duration_cast<Millis>(*deadline - steady_clock::now());

    return std::max(left, Millis::zero());
  }

  bool stop_requested() const noexcept { return stoken.stop_requested(); }

  const std::stop_token &stop_token() const noexcept { return stoken; }

private:
  std::stop_token stoken;
  std::optional<time_point> deadline;
};

} // namespace homecast
