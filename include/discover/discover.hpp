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

#include "base/call_ctx.hpp"
#include "base/conf/token.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"
#include "cast/device.hpp"
#include "cast/session.hpp"
#include "mdns/lookup.hpp"

#include <atomic>
#include <cstdint>

namespace homecast {

/// @brief One discovery pass: browse for cast receivers, connect to each
///        supported one and hand the connected Devices to the caller.
///
///        The lookup runs on the calling thread while a collector thread
///        consumes advertisements as they arrive. Failures for a single
///        advertisement are logged and the advertisement is skipped.
class Discover {
public:
  enum State : uint8_t { Idle = 0, Listening, Draining, Done };

  static constexpr int64_t def_queue_depth{4};
  static constexpr Millis def_connect_timeout{10000};

public:
  Discover(mdns::Lookup &lookup, cast::SessionFactory factory) noexcept;

  Discover(const Discover &) = delete;
  Discover &operator=(const Discover &) = delete;

  /// @brief Run the pass, at most once per instance
  /// @return connected Devices in arrival order, possibly empty
  cast::Devices discover_and_connect(const CallCtx &ctx) noexcept;

  State state() const noexcept { return _state.load(); }

private:
  /// @brief Collector body, runs until the queue is closed and drained
  void collect(const CallCtx &ctx, mdns::AdvertQ &q, cast::Devices &devices) noexcept;

private:
  // order dependent
  mdns::Lookup &lookup;
  cast::SessionFactory factory;
  conf::token tokc;
  std::atomic<State> _state;

public:
  MOD_ID("discover");
};

/// @brief Convenience, a single pass using a temporary Discover
cast::Devices discover_and_connect(const CallCtx &ctx, mdns::Lookup &lookup,
                                   cast::SessionFactory factory) noexcept;

} // namespace homecast
