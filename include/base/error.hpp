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

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace homecast {

namespace sys = boost::system;
namespace errc = boost::system::errc;

using error_code = boost::system::error_code;

/// @brief homecast error conditions reported through error_code
enum class err : int {
  success = 0,
  lookup_failed,     // discovery query failed
  connect_failed,    // control session could not be established
  malformed_uri,     // resource locator could not be built or parsed
  media_unavailable, // control session up, media subsystem unavailable
  playback_failed    // receiver rejected or failed a media command
};

const sys::error_category &error_category() noexcept;

inline error_code make_error_code(err e) noexcept {
  return error_code(static_cast<int>(e), error_category());
}

inline error_code make_error(err e) noexcept { return make_error_code(e); }

inline error_code make_error(errc::errc_t val = errc::success) noexcept {
  return error_code(val, sys::generic_category());
}

} // namespace homecast

namespace boost {
namespace system {
template <> struct is_error_code_enum<homecast::err> : std::true_type {};
} // namespace system
} // namespace boost
