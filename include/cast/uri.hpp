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

#include "base/error.hpp"
#include "base/types.hpp"

#include <optional>

namespace homecast {
namespace cast {

/// @brief Resource locator (RFC 3986 URI reference with a scheme)
///
///        A Uri is only created by parse() and is immutable afterwards.
///        The default constructed Uri is empty.
class Uri {
public:
  Uri() = default;

  /// @brief Parse and validate URI text
  /// @param text URI text
  /// @param uri destination, untouched on failure
  /// @return err::malformed_uri when text is not a valid URI
  static error_code parse(csv text, Uri &uri) noexcept;

  bool empty() const noexcept { return text.empty(); }
  const string &str() const noexcept { return text; }

  const string &scheme() const noexcept { return _scheme; }
  const string &authority() const noexcept { return _authority; }
  const string &path() const noexcept { return _path; }
  const string &query() const noexcept { return _query; }
  const string &fragment() const noexcept { return _fragment; }

  /// @brief Decoded value of the first query parameter named key
  std::optional<string> query_val(csv key) const noexcept;

  bool operator==(const Uri &rhs) const noexcept { return text == rhs.text; }

private:
  string text;
  string _scheme;
  string _authority;
  string _path;
  string _query;
  string _fragment;

public:
  MOD_ID("cast.uri");
};

/// @brief Escape a string for use as a URI query component.
///        Unreserved characters are kept, space becomes '+' and everything
///        else becomes %XX (upper case hex).
string query_escape(csv s) noexcept;

/// @brief Reverse of query_escape
/// @return std::nullopt when s contains a broken percent escape
std::optional<string> query_unescape(csv s) noexcept;

} // namespace cast
} // namespace homecast
