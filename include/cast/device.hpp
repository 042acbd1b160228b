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
#include "cast/session.hpp"
#include "cast/types.hpp"
#include "cast/uri.hpp"
#include "mdns/advert.hpp"

#include <memory>
#include <vector>

namespace homecast {
namespace cast {

/// @brief One cast receiver found by discovery.
///
///        Owns the control Session exclusively. The Device does not close
///        the Session on destruction, the caller is expected to close().
///        Calls on the same Device must be serialized by the caller.
class Device {
public:
  static constexpr csv service_type{"_googlecast._tcp"};
  static constexpr csv model_marker{"md=Google Home"};

public:
  Device(const mdns::Advert &advert, std::unique_ptr<Session> session) noexcept;

  Device(Device &&) = default;
  Device &operator=(Device &&) = default;

  /// @brief Does the advertisement describe a receiver of our family?
  static bool supported(const mdns::Advert &advert) noexcept {
    return advert.txt_has_prefix(model_marker);
  }

  error_code connect(const CallCtx &ctx) noexcept;
  void close() noexcept;

  error_code play(const CallCtx &ctx, const Uri &uri) noexcept;
  error_code speak(const CallCtx &ctx, csv text, csv lang) noexcept;

  error_code queue_load(const CallCtx &ctx, const PlayableItems &items) noexcept;
  error_code queue_insert(const CallCtx &ctx, const PlayableItems &items) noexcept;

  const string &address() const noexcept { return _address; }
  bool connected() const noexcept { return is_connected; }
  const mdns::TxtList &info() const noexcept { return txt; }
  const string &name() const noexcept { return _name; }
  Port port() const noexcept { return _port; }

  // misc debug
  string inspect() const noexcept;

private:
  /// @brief Obtain the media handle, mapping failures to err::media_unavailable
  Media *media(const CallCtx &ctx, error_code &ec) noexcept;

  /// @brief Log a failed command, map it to err::playback_failed
  ///        (cancellation flavored errors pass through)
  static error_code command_result(csv cmd, error_code ec) noexcept;

  /// @brief Shared path of queue_load() and queue_insert()
  error_code queue(const CallCtx &ctx, const PlayableItems &items, bool replace) noexcept;

private:
  // order dependent
  string _address;
  Port _port;
  string _name;
  mdns::TxtList txt;
  std::unique_ptr<Session> session;
  string tts_host;

  // order independent
  bool is_connected{false};

public:
  MOD_ID("cast.device");
};

using Devices = std::vector<Device>;

} // namespace cast
} // namespace homecast
