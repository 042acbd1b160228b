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

#include "cast/device.hpp"
#include "base/conf/token.hpp"
#include "base/elapsed.hpp"
#include "base/logger.hpp"
#include "cast/content.hpp"
#include "cast/tts.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <iterator>

namespace homecast {
namespace cast {

static bool cancelled(const error_code &ec) noexcept {
  return (ec == errc::operation_canceled) || (ec == errc::timed_out);
}

Device::Device(const mdns::Advert &advert, std::unique_ptr<Session> session) noexcept
    : _address(advert.address()),                                    //
      _port(advert.port()),                                          //
      _name(advert.txt_val("fn").value_or(advert.name())),           // friendly name, if any
      txt(advert.txt()),                                             //
      session(std::move(session)),                                   //
      tts_host(conf::token("tts").val<string>("host", tts::def_host)) //
{}

error_code Device::connect(const CallCtx &ctx) noexcept {
  INFO_AUTO_CAT("connect");

  if (auto ec = ctx.check(); ec) {
    INFO_AUTO("[{}:{}] not attempted, reason={}\n", _address, _port, ec.message());
    return ec;
  }

  if (!session) {
    INFO_AUTO("[{}:{}] session closed\n", _address, _port);
    return make_error(err::connect_failed);
  }

  Elapsed e;
  auto ec = session->connect(ctx);
  e.freeze();

  if (ec) {
    is_connected = false;
    INFO_AUTO("[{}:{}] failed, reason={} {}\n", _address, _port, ec.message(), e.humanize());

    return cancelled(ec) ? ec : make_error(err::connect_failed);
  }

  is_connected = true;
  INFO_AUTO("[{}:{}] {} connected {}\n", _address, _port, _name, e.humanize());

  return ec;
}

void Device::close() noexcept {
  if (session) {
    session->close();
    session.reset();
  }

  is_connected = false;
}

error_code Device::command_result(csv cmd, error_code ec) noexcept {
  if (!ec || cancelled(ec)) return ec;

  INFO(cmd, "failed, reason={}\n", ec.message());

  return make_error(err::playback_failed);
}

string Device::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "[{}:{}] {} {}", _address, _port, _name,
                 is_connected ? "CONNECTED" : "CLOSED");

  return msg;
}

Media *Device::media(const CallCtx &ctx, error_code &ec) noexcept {
  INFO_AUTO_CAT("media");

  if (ec = ctx.check(); ec) return nullptr;

  if (!session || !is_connected) {
    INFO_AUTO("[{}:{}] not connected\n", _address, _port);

    ec = make_error(err::media_unavailable);
    return nullptr;
  }

  auto *m = session->media(ctx, ec);

  if (ec || (m == nullptr)) {
    INFO_AUTO("[{}:{}] unavailable, reason={}\n", _address, _port, ec.message());

    if (!cancelled(ec)) ec = make_error(err::media_unavailable);
    return nullptr;
  }

  return m;
}

error_code Device::play(const CallCtx &ctx, const Uri &uri) noexcept {
  if (uri.empty()) return make_error(err::malformed_uri);

  error_code ec;
  auto *m = media(ctx, ec);

  if (m == nullptr) return ec;

  const LoadRequest req{.media = content::single(uri), .current_time = 0.0, .autoplay = true};

  INFO("load", "content_id={}\n", req.media.content_id);

  return command_result("load", m->load(ctx, req));
}

error_code Device::queue(const CallCtx &ctx, const PlayableItems &items, bool replace) noexcept {
  const auto no_uri = std::any_of(items.begin(), items.end(),
                                  [](const PlayableItem &item) { return item.uri.empty(); });

  if (no_uri) return make_error(err::malformed_uri);

  error_code ec;
  auto *m = media(ctx, ec);

  if (m == nullptr) return ec;

  QueueRequest req{.items = content::many(items), .start_index = std::nullopt};

  if (replace) {
    req.start_index = 0;

    INFO("queue_load", "items={}\n", req.items.size());
    return command_result("queue_load", m->queue_load(ctx, req));
  }

  INFO("queue_insert", "items={}\n", req.items.size());
  return command_result("queue_insert", m->queue_insert(ctx, req));
}

error_code Device::queue_insert(const CallCtx &ctx, const PlayableItems &items) noexcept {
  return queue(ctx, items, false);
}

error_code Device::queue_load(const CallCtx &ctx, const PlayableItems &items) noexcept {
  return queue(ctx, items, true);
}

error_code Device::speak(const CallCtx &ctx, csv text, csv lang) noexcept {
  INFO_AUTO_CAT("speak");

  Uri uri;

  if (auto ec = tts::resolve(tts_host, text, lang, uri); ec) {
    INFO_AUTO("resolve failed, lang={} reason={}\n", lang, ec.message());
    return ec;
  }

  return play(ctx, uri);
}

} // namespace cast
} // namespace homecast
