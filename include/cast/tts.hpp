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
#include "cast/uri.hpp"

namespace homecast {
namespace cast {
namespace tts {

/// @brief speech synthesis endpoint host used when none is configured
static constexpr csv def_host{"translate.google.com"};

/// @brief Produce the locator of a speech rendition of text.
///
///        The endpoint is unofficial and may change behavior at any time.
///        This is a pure transformation, nothing is fetched.
/// @param text text to speak (any string, may be empty)
/// @param lang language tag (any string, may be empty)
/// @param uri destination, untouched on failure
/// @return err::malformed_uri if the templated text is not a valid uri
error_code resolve(csv text, csv lang, Uri &uri) noexcept;

/// @brief As above using an explicit endpoint host
error_code resolve(csv host, csv text, csv lang, Uri &uri) noexcept;

} // namespace tts
} // namespace cast
} // namespace homecast
