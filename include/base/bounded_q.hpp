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

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace homecast {

/// @brief Bounded, closable FIFO connecting one producer and one consumer.
///        push() blocks while the queue is full, pop() blocks while it is
///        empty. After close() pushes are refused and pop() drains the
///        remaining items before returning std::nullopt.
template <typename T> class BoundedQ {

public:
  BoundedQ(size_t max_depth = 4) noexcept : _max_depth(max_depth ? max_depth : 1) {}

  BoundedQ(const BoundedQ &) = delete;
  BoundedQ &operator=(const BoundedQ &) = delete;

  /// @brief Close the queue, returns false if it was already closed
  bool close() {
    {
      std::lock_guard lck(_mtx);

      if (_closed) return false;
      _closed = true;
    }

    _available.notify_all();
    _space.notify_all();

    return true;
  }

  bool closed() const {
    std::lock_guard lck(_mtx);

    return _closed;
  }

  size_t max_depth() const noexcept { return _max_depth; }

  std::optional<T> pop() {
    std::optional<T> item;

    {
      std::unique_lock lck(_mtx);

      _available.wait(lck, [this] { return !_queue.empty() || _closed; });

      if (_queue.empty()) return item; // closed and drained

      item.emplace(std::move(_queue.front()));
      _queue.pop();
    }

    _space.notify_one();

    return item;
  }

  /// @brief Push an item, blocking while the queue is full
  /// @return false when the queue is closed (item discarded)
  bool push(T item) {
    {
      std::unique_lock lck(_mtx);

      _space.wait(lck, [this] { return (_queue.size() < _max_depth) || _closed; });

      if (_closed) return false;

      _queue.push(std::move(item));
    }

    _available.notify_one();

    return true;
  }

  size_t size() const {
    std::lock_guard lck(_mtx);

    return _queue.size();
  }

private:
  const size_t _max_depth;

  mutable std::mutex _mtx;
  std::queue<T> _queue;
  std::condition_variable _available;
  std::condition_variable _space;
  bool _closed{false};
};

} // namespace homecast
