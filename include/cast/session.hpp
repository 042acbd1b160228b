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
#include "base/error.hpp"
#include "base/types.hpp"
#include "cast/types.hpp"

#include <functional>
#include <memory>

namespace homecast {
namespace cast {

/// @brief Media control handle obtained from a connected Session.
///        Owned by the Session, valid until the Session is closed.
///
///        Implementations send the command, await the receiver's reply and
///        return an error when the receiver rejects or fails it. The ctx
///        must be honoured: a stop request or deadline aborts the command.
class Media {
public:
  virtual ~Media() = default;

  virtual error_code load(const CallCtx &ctx, const LoadRequest &req) noexcept = 0;

  /// @brief Replace the receiver queue with req.items starting at req.start_index
  virtual error_code queue_load(const CallCtx &ctx, const QueueRequest &req) noexcept = 0;

  /// @brief Add req.items to the existing queue, the insertion point is
  ///        defined by the receiver firmware when req.start_index is absent
  virtual error_code queue_insert(const CallCtx &ctx, const QueueRequest &req) noexcept = 0;
};

/// @brief Persistent, authenticated control channel to one receiver.
///        Framing, encryption, heartbeats and retries live entirely
///        inside the implementation.
class Session {
public:
  virtual ~Session() = default;

  virtual error_code connect(const CallCtx &ctx) noexcept = 0;

  /// @brief Obtain the media control handle (launching the receiver's
  ///        media application as needed)
  /// @param ctx execution context
  /// @param ec set on failure
  /// @return non-owning pointer, nullptr on failure
  virtual Media *media(const CallCtx &ctx, error_code &ec) noexcept = 0;

  /// @brief Release the channel, must be safe after a failed connect
  virtual void close() noexcept = 0;
};

/// @brief Creates an unconnected Session for host:port
using SessionFactory = std::function<std::unique_ptr<Session>(const string &host, Port port)>;

} // namespace cast
} // namespace homecast
