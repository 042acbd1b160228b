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

#include "base/bounded_q.hpp"
#include "base/call_ctx.hpp"
#include "base/error.hpp"
#include "base/types.hpp"
#include "mdns/advert.hpp"

namespace homecast {
namespace mdns {

using AdvertQ = BoundedQ<Advert>;

/// @brief "lookup services by name" capability
class Lookup {
public:
  virtual ~Lookup() = default;

  /// @brief Query for services of stype and push each resolved
  ///        advertisement into q as it arrives.
  ///
  ///        Blocks until the implementation's own deadline elapses (capped by
  ///        the ctx deadline) or a stop is requested. Does not close q.
  /// @param ctx execution context
  /// @param stype service type (e.g. "_googlecast._tcp")
  /// @param q destination queue
  /// @return err::lookup_failed when the query could not be performed
  virtual error_code lookup(const CallCtx &ctx, csv stype, AdvertQ &q) noexcept = 0;
};

} // namespace mdns
} // namespace homecast
