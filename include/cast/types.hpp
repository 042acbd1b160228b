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
#include "cast/uri.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace homecast {
namespace cast {

/// @brief Something to play: a locator and an optional display title
struct PlayableItem {
  Uri uri;
  std::optional<string> title;
};

using PlayableItems = std::vector<PlayableItem>;

struct MetaData {
  int type{0};
  string title;

  bool operator==(const MetaData &) const = default;
};

/// @brief Protocol facing description of a single playable item
struct MediaItem {
  string content_id;
  string content_type;
  string stream_type;
  std::optional<MetaData> metadata;

  bool operator==(const MediaItem &) const = default;
};

using MediaItems = std::vector<MediaItem>;

/// @brief Single item load command
struct LoadRequest {
  MediaItem media;
  double current_time{0.0}; // seconds into the item
  bool autoplay{true};
};

/// @brief Queue load / insert command, items in playback order.
///        start_index is absent for inserts (receiver default applies).
struct QueueRequest {
  MediaItems items;
  std::optional<uint32_t> start_index;
};

} // namespace cast
} // namespace homecast
