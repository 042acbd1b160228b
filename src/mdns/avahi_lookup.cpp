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

#include "mdns/avahi_lookup.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <array>
#include <avahi-common/address.h>
#include <avahi-common/strlst.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <pthread.h>

namespace homecast {
namespace mdns {

Ctx::Ctx(AdvertQ &q) noexcept : q(q), accepting{true} {}

Ctx::~Ctx() noexcept {
  accepting = false;

  // stopping the poll joins the avahi thread, after that no callbacks can fire
  if (poll_running) avahi_threaded_poll_stop(tpoll);

  if (sb) avahi_service_browser_free(sb);
  if (client) avahi_client_free(client);
  if (tpoll) avahi_threaded_poll_free(tpoll);
}

error_code Ctx::browse(csv stype) noexcept {
  INFO_AUTO_CAT("browse");

  tpoll = avahi_threaded_poll_new();

  if (tpoll == nullptr) {
    INFO_AUTO("failed to allocate threaded_poll\n");
    return make_error(err::lookup_failed);
  }

  int rc{0};

  // note: the client callback fires from within avahi_client_new
  client = avahi_client_new(avahi_threaded_poll_get(tpoll), AvahiClientFlags(0), cb_client, this,
                            &rc);

  if (client == nullptr) {
    INFO_AUTO("failed to allocate client, reason={}\n", avahi_strerror(rc));
    return make_error(err::lookup_failed);
  }

  const string type(stype); // avahi expects a null terminated string

  sb = avahi_service_browser_new(client,              // client
                                 AVAHI_IF_UNSPEC,     // network interface
                                 AVAHI_PROTO_UNSPEC,  // any protocol
                                 type.c_str(),        // service type
                                 nullptr,             // domain
                                 (AvahiLookupFlags)0, // lookup flags
                                 Ctx::cb_browse,      // callback
                                 this);               // userdata

  if (sb == nullptr) {
    INFO_AUTO("create failed {} reason={}\n", type, error_string(client));
    return make_error(err::lookup_failed);
  }

  if (rc = avahi_threaded_poll_start(tpoll); rc < 0) {
    INFO_AUTO("poll start failed, reason={}\n", avahi_strerror(rc));
    return make_error(err::lookup_failed);
  }

  poll_running = true;
  INFO_AUTO("initiated browse for {}\n", type);

  return make_error();
}

void Ctx::cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                    AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                    AvahiLookupResultFlags, void *user_data) { // static
  INFO_AUTO_CAT("cb_browse");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (event) {
  case AVAHI_BROWSER_FAILURE: {
    ctx->failed(error_string(b));
  } break;

  case AVAHI_BROWSER_NEW: {
    INFO_AUTO("NEW {} {}\n", type, name);

    // resolve to an IPv4 address, the resolver frees itself in cb_resolve
    auto r = avahi_service_resolver_new(avahi_service_browser_get_client(b), // the client
                                        iface,                               // same interface
                                        protocol,                            // same protocol
                                        name,                                // same service name
                                        type,                                // same service type
                                        domain,                              // same domain
                                        AVAHI_PROTO_INET,                    // IPv4 address
                                        (AvahiLookupFlags)0,                 // resolve flags
                                        cb_resolve,                          // callback
                                        user_data);                          // same userdata

    if (!r) INFO_AUTO("RESOLVER failed, name={} reason={}\n", name, error_string(b));
  } break;

  case AVAHI_BROWSER_REMOVE: {
    INFO_AUTO("REMOVE {} {} {}\n", name, type, domain);
  } break;

  case AVAHI_BROWSER_ALL_FOR_NOW:
  case AVAHI_BROWSER_CACHE_EXHAUSTED:
    break;
  }
}

void Ctx::cb_client(AvahiClient *client, AvahiClientState state, void *user_data) { // static
  INFO_AUTO_CAT("cb_client");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (state) {
  case AVAHI_CLIENT_CONNECTING: {
    INFO_AUTO("CONNECTING, client={}\n", fmt::ptr(client));
  } break;

  case AVAHI_CLIENT_S_RUNNING: {
    pthread_setname_np(pthread_self(), "homecast_mdns");

    INFO_AUTO("RUNNING, vsn='{}'\n", avahi_client_get_version_string(client));
  } break;

  case AVAHI_CLIENT_FAILURE: {
    ctx->failed(error_string(client));
  } break;

  case AVAHI_CLIENT_S_REGISTERING:
  case AVAHI_CLIENT_S_COLLISION:
    break;
  }
}

void Ctx::cb_resolve(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol,
                     AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                     const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                     AvahiLookupResultFlags, void *user_data) { // static
  INFO_AUTO_CAT("cb_resolve");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (event) {
  case AVAHI_RESOLVER_FAILURE: {
    INFO_AUTO("FAILED, name={} reason={}\n", name, error_string(r));
  } break;

  case AVAHI_RESOLVER_FOUND: {
    std::array<char, AVAHI_ADDRESS_STR_MAX> addr_str{0};
    avahi_address_snprint(addr_str.data(), addr_str.size(), address);

    ctx->resolved({
        .name_net = name,                //
        .hostname = host_name,           //
        .address = addr_str.data(),      //
        .port = port,                    //
        .type = type,                    //
        .domain = domain,                //
        .txt_list = make_txt_list(txt)   //
    });
  } break;
  }

  if (r) avahi_service_resolver_free(r);
}

void Ctx::failed(string reason) noexcept {
  INFO("failed", "reason={}\n", reason);

  {
    std::lock_guard lck(mtx);
    failure = true;
    err_msg = std::move(reason);
  }

  cv.notify_all();
}

TxtList Ctx::make_txt_list(AvahiStringList *txt) noexcept { // static
  TxtList txt_list;

  for (AvahiStringList *e = txt; e != nullptr; e = avahi_string_list_get_next(e)) {
    auto *text = reinterpret_cast<ccs>(avahi_string_list_get_text(e));

    txt_list.emplace_back(text, avahi_string_list_get_size(e));
  }

  return txt_list;
}

void Ctx::resolved(Advert::Details &&details) noexcept {
  INFO_AUTO_CAT("resolved");

  // the lookup window has closed, the queue may already be closed too
  if (!accepting) return;

  // a service seen on more than one interface or protocol resolves more than once
  if (!seen.emplace(details.name_net).second) return;

  INFO_AUTO("[{}:{}] {}\n", details.address, details.port, details.name_net);

  // blocks while the collector is behind, fails once the queue is closed
  if (!q.push(Advert(std::move(details)))) accepting = false;
}

error_code Ctx::wait(const CallCtx &ctx, Millis timeout) noexcept {
  INFO_AUTO_CAT("wait");

  const auto until = steady_clock::now() + std::min(ctx.remaining(timeout), timeout);

  std::unique_lock lck(mtx);
  cv.wait_until(lck, ctx.stop_token(), until, [this]() { return failure; });

  accepting = false;

  if (failure) {
    INFO_AUTO("browse failed, reason={}\n", err_msg);
    return make_error(err::lookup_failed);
  }

  if (ctx.stop_requested()) return make_error(errc::operation_canceled);

  return make_error();
}

AvahiLookup::AvahiLookup() noexcept
    : tokc(module_id), //
      _timeout(tokc.timeout_val("lookup", def_timeout)) {}

error_code AvahiLookup::lookup(const CallCtx &ctx, csv stype, AdvertQ &q) noexcept {
  INFO_AUTO_CAT("lookup");

  if (auto ec = ctx.check(); ec) return ec;

  Ctx mctx(q);

  if (auto ec = mctx.browse(stype); ec) return ec;

  INFO_AUTO("browsing {} for {}\n", stype, _timeout);

  return mctx.wait(ctx, _timeout);
}

} // namespace mdns
} // namespace homecast
