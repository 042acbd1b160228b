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
#include "base/error.hpp"
#include "base/types.hpp"
#include "mdns/advert.hpp"
#include "mdns/lookup.hpp"

#include <atomic>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/thread-watch.h>
#include <condition_variable>
#include <mutex>
#include <set>
#include <type_traits>

namespace homecast {
namespace mdns {

/// @brief State of a single browse: the avahi threaded poll, client and
///        service browser plus the queue resolved services are pushed into.
///        Everything is released when the Ctx is destroyed.
class Ctx {
public:
  Ctx(AdvertQ &q) noexcept;
  ~Ctx() noexcept;

  Ctx(const Ctx &) = delete;
  Ctx &operator=(const Ctx &) = delete;

  /// @brief Allocate the client and browser for stype then start the poll thread
  /// @return err::lookup_failed when avahi is unavailable
  error_code browse(csv stype) noexcept;

  /// @brief Block until timeout elapses (capped by the ctx deadline), a stop
  ///        is requested or the client/browser fails
  error_code wait(const CallCtx &ctx, Millis timeout) noexcept;

  /// @brief Record a client or browser failure and wake wait()
  void failed(string reason) noexcept;

  /// @brief Queue a resolved service once per instance name while the
  ///        lookup window is open
  void resolved(Advert::Details &&details) noexcept;

private:
  // avahi callbacks
  static void cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags flags, void *d);
  static void cb_client(AvahiClient *client, AvahiClientState state, void *d);
  static void cb_resolve(AvahiServiceResolver *r, AvahiIfIndex iface, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags flags, void *d);

  template <typename T> static string error_string(T t) {
    using U = std::remove_pointer_t<T>;

    if constexpr (std::is_same_v<U, AvahiClient>) {
      return string(avahi_strerror(avahi_client_errno(t)));
    } else if constexpr (std::is_same_v<U, AvahiServiceBrowser>) {
      return error_string(avahi_service_browser_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiServiceResolver>) {
      return error_string(avahi_service_resolver_get_client(t));
    } else {
      static_assert(AlwaysFalse<U>, "unhandled Avahi type");
    }
  }

  static TxtList make_txt_list(AvahiStringList *txt) noexcept;

private:
  // order dependent
  AdvertQ &q;
  std::atomic_bool accepting;

  // order independent
  AvahiThreadedPoll *tpoll{nullptr};
  AvahiClient *client{nullptr};
  AvahiServiceBrowser *sb{nullptr};
  bool poll_running{false};

  std::set<string> seen; // instance names already queued, poll thread only

  std::mutex mtx;
  std::condition_variable_any cv;
  bool failure{false};
  string err_msg;

public:
  MOD_ID("mdns.ctx");
};

/// @brief Lookup implemented with the Avahi client library
class AvahiLookup : public Lookup {
public:
  static constexpr Millis def_timeout{1000};

public:
  AvahiLookup() noexcept;

  error_code lookup(const CallCtx &ctx, csv stype, AdvertQ &q) noexcept override;

  Millis timeout() const noexcept { return _timeout; }

private:
  // order dependent
  conf::token tokc;
  Millis _timeout;

public:
  MOD_ID("mdns");
};

} // namespace mdns
} // namespace homecast
