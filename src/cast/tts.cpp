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

#include "cast/tts.hpp"

#include <fmt/format.h>

namespace homecast {
namespace cast {
namespace tts {

error_code resolve(csv text, csv lang, Uri &uri) noexcept {
  return resolve(def_host, text, lang, uri);
}

error_code resolve(csv host, csv text, csv lang, Uri &uri) noexcept {
  static constexpr auto url_fmt{"https://{}/translate_tts?client=tw-ob&ie=UTF-8&q={}&tl={}"};

  const auto text_url = fmt::format(url_fmt, host, query_escape(text), query_escape(lang));

  return Uri::parse(text_url, uri);
}

} // namespace tts
} // namespace cast
} // namespace homecast
