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

#include "base/types.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace homecast {
namespace mdns {

/// @brief raw TXT strings as advertised, e.g. "md=Google Home"
using TxtList = std::vector<string>;

/// @brief One resolved service advertisement
class Advert {
public:
  struct Details {
    string name_net; // service instance name
    string hostname;
    string address; // IPv4 text
    Port port{0};
    string type;
    string domain;
    TxtList txt_list;
  };

public:
  Advert() = default;
  Advert(Details d) noexcept;

public:
  const string &address() const noexcept { return _address; }
  const string &domain() const noexcept { return _domain; }
  const string &hostname() const noexcept { return _hostname; }
  const string &name() const noexcept { return name_net; }
  Port port() const noexcept { return _port; }
  const TxtList &txt() const noexcept { return _txt_list; }
  const string &type() const noexcept { return _type; }

  /// @brief Does any TXT string begin with prefix?
  bool txt_has_prefix(csv prefix) const noexcept {
    return std::any_of(_txt_list.begin(), _txt_list.end(),
                       [=](const auto &txt) { return csv{txt}.starts_with(prefix); });
  }

  /// @brief Value of the first key=val TXT string with a matching key
  std::optional<string> txt_val(csv key) const noexcept;

  // misc debug
  string inspect() const noexcept;

private:
  // order dependent
  string name_net;
  string _hostname;
  string _address;
  Port _port{0};
  string _type;
  string _domain;
  TxtList _txt_list;

public:
  MOD_ID("mdns.advert");
};

} // namespace mdns
} // namespace homecast
