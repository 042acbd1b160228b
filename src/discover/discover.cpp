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

#include "discover/discover.hpp"
#include "base/elapsed.hpp"
#include "base/logger.hpp"

#include <fmt/format.h>
#include <thread>
#include <utility>

namespace homecast {

Discover::Discover(mdns::Lookup &lookup, cast::SessionFactory factory) noexcept
    : lookup(lookup),             //
      factory(std::move(factory)), //
      tokc(module_id),             //
      _state{Idle}                 //
{}

void Discover::collect(const CallCtx &ctx, mdns::AdvertQ &q, cast::Devices &devices) noexcept {
  INFO_AUTO_CAT("collect");

  const auto connect_timeout = tokc.timeout_val("connect", def_connect_timeout);

  while (auto advert = q.pop()) {
    INFO("advert", "advertisement detected {}\n", advert->inspect());

    if (!cast::Device::supported(*advert)) continue;

    auto session = factory ? factory(advert->address(), advert->port()) : nullptr;

    if (!session) {
      INFO("connect", "[{}:{}] no session available\n", advert->address(), advert->port());
      continue;
    }

    cast::Device device(*advert, std::move(session));

    if (auto ec = device.connect(ctx.child(connect_timeout)); ec) {
      INFO("connect", "failed {} reason={}\n", device.inspect(), ec.message());

      device.close();
      continue;
    }

    INFO_AUTO("{}\n", device.inspect());
    devices.emplace_back(std::move(device));
  }
}

cast::Devices Discover::discover_and_connect(const CallCtx &ctx) noexcept {
  INFO_AUTO_CAT("discover");

  cast::Devices devices;

  if (auto expected = Idle; !_state.compare_exchange_strong(expected, Listening)) {
    INFO_AUTO("pass already run, state={}\n", static_cast<uint8_t>(expected));
    return devices;
  }

  const auto depth = tokc.val<int64_t>("queue_depth", def_queue_depth);
  mdns::AdvertQ q(static_cast<size_t>(depth > 0 ? depth : def_queue_depth));

  Elapsed e;

  {
    std::jthread collector([&, this]() { collect(ctx, q, devices); });

    if (auto ec = lookup.lookup(ctx, cast::Device::service_type, q); ec) {
      INFO("lookup", "failed, reason={}\n", ec.message());
    }

    _state = Draining;
    q.close();
  } // collector joins once the queue is drained

  _state = Done;

  INFO_AUTO("found {} device(s) in {}\n", devices.size(), e.humanize());

  return devices;
}

cast::Devices discover_and_connect(const CallCtx &ctx, mdns::Lookup &lookup,
                                   cast::SessionFactory factory) noexcept {
  Discover discover(lookup, std::move(factory));

  return discover.discover_and_connect(ctx);
}

} // namespace homecast
