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
#include "cast/types.hpp"
#include "cast/uri.hpp"

namespace homecast {
namespace cast {
namespace content {

// fixed for the receiver family
static constexpr csv type{"audio/mp3"};
static constexpr csv stream{"BUFFERED"};
static constexpr int metadata_type{3}; // music track

/// @brief MediaItem for a single locator, never carries metadata
MediaItem single(const Uri &uri) noexcept;

/// @brief MediaItems for a playlist, same order and length as items.
///        Each carries metadata with the item title (empty when absent).
MediaItems many(const PlayableItems &items) noexcept;

} // namespace content
} // namespace cast
} // namespace homecast
