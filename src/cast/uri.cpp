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

#include "cast/uri.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>

namespace homecast {
namespace cast {

namespace {
namespace ranges = std::ranges;

// ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool scheme_ok(csv scheme) noexcept {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) return false;

  return ranges::all_of(scheme, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || (c == '+') || (c == '-') || (c == '.');
  });
}

bool is_unreserved(char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || (c == '-') || (c == '_') || (c == '.') ||
         (c == '~');
}

constexpr int hex_val(char c) noexcept {
  if ((c >= '0') && (c <= '9')) return c - '0';
  if ((c >= 'a') && (c <= 'f')) return c - 'a' + 10;
  if ((c >= 'A') && (c <= 'F')) return c - 'A' + 10;

  return -1;
}

// every % must be followed by two hex digits
bool escapes_ok(csv s) noexcept {
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] != '%') continue;

    if (((i + 2) >= s.size()) || (hex_val(s[i + 1]) < 0) || (hex_val(s[i + 2]) < 0)) {
      return false;
    }

    i += 2;
  }

  return true;
}

bool authority_ok(csv a) noexcept {
  static constexpr csv allowed{"-._~!$&'()*+,;=:@[]%"};

  return ranges::all_of(a, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || allowed.find(c) != csv::npos;
  });
}

} // namespace

error_code Uri::parse(csv text, Uri &uri) noexcept {

  // no whitespace or control characters anywhere
  const auto bad_char = ranges::any_of(text, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return (uc <= 0x20) || (uc == 0x7f);
  });

  if (text.empty() || bad_char || !escapes_ok(text)) return make_error(err::malformed_uri);

  // split per RFC 3986 appendix B: scheme ":" ["//" authority] path ["?" query] ["#" fragment]
  const auto colon = text.find_first_of(":/?#");
  if ((colon == csv::npos) || (colon == 0) || (text[colon] != ':')) {
    return make_error(err::malformed_uri);
  }

  Uri parsed;
  parsed.text.assign(text);
  parsed._scheme.assign(text.substr(0, colon));

  auto rest = text.substr(colon + 1);

  if (const auto hash = rest.find('#'); hash != csv::npos) {
    parsed._fragment.assign(rest.substr(hash + 1));
    rest = rest.substr(0, hash);
  }

  if (const auto qmark = rest.find('?'); qmark != csv::npos) {
    parsed._query.assign(rest.substr(qmark + 1));
    rest = rest.substr(0, qmark);
  }

  const auto hierarchical = rest.starts_with("//");

  if (hierarchical) {
    rest.remove_prefix(2);

    const auto slash = rest.find('/');
    parsed._authority.assign(rest.substr(0, slash));
    rest = (slash == csv::npos) ? csv{} : rest.substr(slash);
  }

  parsed._path.assign(rest);

  if (!scheme_ok(parsed._scheme)) return make_error(err::malformed_uri);

  // hierarchical uris (with //) must carry a sane authority
  if (hierarchical && !authority_ok(parsed._authority)) return make_error(err::malformed_uri);

  uri = std::move(parsed);

  return make_error();
}

std::optional<string> Uri::query_val(csv key) const noexcept {
  string_view q{_query};

  while (!q.empty()) {
    const auto amp = q.find('&');
    const auto kv = q.substr(0, amp);

    const auto eq = kv.find('=');
    const auto k = query_unescape(kv.substr(0, eq));

    if (k.has_value() && (*k == key)) {
      if (eq == csv::npos) return string();

      return query_unescape(kv.substr(eq + 1));
    }

    q = (amp == csv::npos) ? string_view{} : q.substr(amp + 1);
  }

  return std::nullopt;
}

string query_escape(csv s) noexcept {
  static constexpr csv hex{"0123456789ABCDEF"};

  string escaped;
  escaped.reserve(s.size() * 3);

  for (const char c : s) {
    if (is_unreserved(c)) {
      escaped.push_back(c);
    } else if (c == ' ') {
      escaped.push_back('+');
    } else {
      const auto uc = static_cast<unsigned char>(c);

      escaped.push_back('%');
      escaped.push_back(hex[uc >> 4]);
      escaped.push_back(hex[uc & 0x0f]);
    }
  }

  return escaped;
}

std::optional<string> query_unescape(csv s) noexcept {
  if (!escapes_ok(s)) return std::nullopt;

  string raw;
  raw.reserve(s.size());

  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '+') {
      raw.push_back(' ');
    } else if (s[i] == '%') {
      raw.push_back(static_cast<char>((hex_val(s[i + 1]) << 4) | hex_val(s[i + 2])));
      i += 2;
    } else {
      raw.push_back(s[i]);
    }
  }

  return raw;
}

} // namespace cast
} // namespace homecast
