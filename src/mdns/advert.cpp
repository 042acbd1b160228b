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

#include "mdns/advert.hpp"

#include <fmt/format.h>
#include <iterator>

namespace homecast {
namespace mdns {

Advert::Advert(Details d) noexcept
    : name_net(std::move(d.name_net)), // service instance name
      _hostname(std::move(d.hostname)), //
      _address(std::move(d.address)),   // service host address
      _port(d.port),                    // service port
      _type(std::move(d.type)),         // service type
      _domain(std::move(d.domain)),     // service domain
      _txt_list(std::move(d.txt_list))  // txt records
{}

std::optional<string> Advert::txt_val(csv key) const noexcept {

  for (const auto &txt : _txt_list) {
    const csv kv{txt};

    if (kv.starts_with(key) && (kv.size() > key.size()) && (kv[key.size()] == '=')) {
      return string(kv.substr(key.size() + 1));
    }
  }

  return std::nullopt;
}

string Advert::inspect() const noexcept {
  string msg;
  auto w = std::back_inserter(msg);

  fmt::format_to(w, "[{}:{}]{} {} {} TXT:", _address, _port, name_net, _type, _hostname);

  for (const auto &txt : _txt_list) {
    fmt::format_to(w, " {}", txt);
  }

  return msg;
}

} // namespace mdns
} // namespace homecast
