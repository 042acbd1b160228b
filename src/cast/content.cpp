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

#include "cast/content.hpp"

#include <algorithm>
#include <iterator>

namespace homecast {
namespace cast {
namespace content {

MediaItem single(const Uri &uri) noexcept {
  return MediaItem{.content_id = uri.str(),         //
                   .content_type = string(type),    //
                   .stream_type = string(stream),   //
                   .metadata = std::nullopt};
}

MediaItems many(const PlayableItems &items) noexcept {
  MediaItems media_items;
  media_items.reserve(items.size());

  std::transform(items.begin(), items.end(), std::back_inserter(media_items),
                 [](const PlayableItem &item) {
                   auto mi = single(item.uri);

                   mi.metadata.emplace(MetaData{.type = metadata_type, //
                                                .title = item.title.value_or(string())});

                   return mi;
                 });

  return media_items;
}

} // namespace content
} // namespace cast
} // namespace homecast
