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

#include "base/error.hpp"

namespace homecast {

namespace {

class category : public sys::error_category {
public:
  const char *name() const noexcept override { return "homecast"; }

  string message(int ev) const override {
    switch (static_cast<err>(ev)) {
    case err::success:
      return "success";
    case err::lookup_failed:
      return "service lookup failed";
    case err::connect_failed:
      return "failed to connect control session";
    case err::malformed_uri:
      return "malformed uri";
    case err::media_unavailable:
      return "media control unavailable";
    case err::playback_failed:
      return "playback command failed";
    }

    return "unknown homecast error";
  }
};

} // namespace

const sys::error_category &error_category() noexcept {
  static const category cat;

  return cat;
}

} // namespace homecast
