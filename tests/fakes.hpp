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
#include "mdns/lookup.hpp"

#include <QtGlobal>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace homecast {
namespace test {

/// @brief Everything a FakeSession saw, shared with the test after the
///        session itself has moved into a Device
struct Record {
  std::atomic_int connects{0};
  std::atomic_int closes{0};
  std::atomic_int media_calls{0};

  std::vector<cast::LoadRequest> loads;
  std::vector<cast::QueueRequest> queue_loads;
  std::vector<cast::QueueRequest> queue_inserts;

  // injected failures
  error_code connect_ec;
  error_code media_ec;
  error_code command_ec;

  int commands() const noexcept {
    return static_cast<int>(loads.size() + queue_loads.size() + queue_inserts.size());
  }
};

class FakeMedia : public cast::Media {
public:
  FakeMedia(std::shared_ptr<Record> rec) noexcept : rec(std::move(rec)) {}

  error_code load(const CallCtx &ctx, const cast::LoadRequest &req) noexcept override {
    if (auto ec = ctx.check(); ec) return ec;

    rec->loads.push_back(req);
    return rec->command_ec;
  }

  error_code queue_load(const CallCtx &ctx, const cast::QueueRequest &req) noexcept override {
    if (auto ec = ctx.check(); ec) return ec;

    rec->queue_loads.push_back(req);
    return rec->command_ec;
  }

  error_code queue_insert(const CallCtx &ctx, const cast::QueueRequest &req) noexcept override {
    if (auto ec = ctx.check(); ec) return ec;

    rec->queue_inserts.push_back(req);
    return rec->command_ec;
  }

private:
  std::shared_ptr<Record> rec;
};

class FakeSession : public cast::Session {
public:
  FakeSession(std::shared_ptr<Record> rec) noexcept : rec(rec), _media(rec) {}

  error_code connect(const CallCtx &ctx) noexcept override {
    rec->connects++;

    if (auto ec = ctx.check(); ec) return ec;

    return rec->connect_ec;
  }

  cast::Media *media(const CallCtx &, error_code &ec) noexcept override {
    rec->media_calls++;

    ec = rec->media_ec;
    return ec ? nullptr : &_media;
  }

  void close() noexcept override { rec->closes++; }

private:
  std::shared_ptr<Record> rec;
  FakeMedia _media;
};

/// @brief SessionFactory handing out FakeSessions, one Record per host:port
///        (created on first use) so tests can inject failures per receiver
class FakeFactory {
public:
  std::shared_ptr<Record> record(const string &host, Port port) {
    std::lock_guard lck(mtx);

    auto &rec = records[key(host, port)];
    if (!rec) rec = std::make_shared<Record>();

    return rec;
  }

  int created() const noexcept { return _created.load(); }

  cast::SessionFactory factory() {
    return [this](const string &host, Port port) -> std::unique_ptr<cast::Session> {
      _created++;
      return std::make_unique<FakeSession>(record(host, port));
    };
  }

private:
  static string key(const string &host, Port port) { return host + ":" + std::to_string(port); }

private:
  std::mutex mtx;
  std::map<string, std::shared_ptr<Record>> records;
  std::atomic_int _created{0};
};

/// @brief Uri from known good text, empty (and a warning) otherwise
inline cast::Uri make_uri(csv text) {
  cast::Uri uri;

  if (auto ec = cast::Uri::parse(text, uri); ec) {
    qWarning("bad uri %s: %s", string(text).c_str(), ec.message().c_str());
  }

  return uri;
}

/// @brief Build an advertisement the way the Avahi adapter would
inline mdns::Advert make_advert(const string &name, const string &address, Port port,
                                mdns::TxtList txt) {
  return mdns::Advert({.name_net = name,
                       .hostname = name + ".local",
                       .address = address,
                       .port = port,
                       .type = "_googlecast._tcp",
                       .domain = "local",
                       .txt_list = std::move(txt)});
}

/// @brief Lookup streaming a scripted list of advertisements
class FakeLookup : public mdns::Lookup {
public:
  FakeLookup(std::vector<mdns::Advert> adverts = {}, error_code result = {}) noexcept
      : adverts(std::move(adverts)), result(result) {}

  error_code lookup(const CallCtx &ctx, csv stype, mdns::AdvertQ &q) noexcept override {
    calls++;
    last_stype = string(stype);

    for (const auto &advert : adverts) {
      if (auto ec = ctx.check(); ec) return ec;

      if (q.push(advert)) pushed++;
    }

    if (hold_until_stopped) {
      while (!ctx.stop_requested()) {
        std::this_thread::sleep_for(Millis(5));
      }

      return make_error(errc::operation_canceled);
    }

    return result;
  }

public:
  std::vector<mdns::Advert> adverts;
  error_code result;
  bool hold_until_stopped{false};

  std::atomic_int calls{0};
  std::atomic_int pushed{0};
  string last_stype;
};

} // namespace test
} // namespace homecast
