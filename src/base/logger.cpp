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

#include "base/logger.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fmt/chrono.h>
#include <pthread.h>
#include <system_error>

namespace homecast {

std::unique_ptr<Logger> _logger;

Elapsed Logger::e;

static constexpr auto def_out_path{"/dev/stdout"};
static constexpr auto fallback_out_path{"/dev/stderr"};
static constexpr auto flags{fmt::file::WRONLY | fmt::file::APPEND | fmt::file::CREATE};

Logger::Logger() noexcept
    : tokc(module_id),                   //
      guard(asio::make_work_guard(io_ctx)) //
{
  const auto path = tokc.val<string>("file", def_out_path);

  for (const auto &p : std::array{path, string(fallback_out_path)}) {
    try {
      out.emplace(fmt::output_file(p, flags));
      break;
    } catch (const std::system_error &) {
      // try the next path, when none can be opened messages are dropped
    }
  }

  const auto now = std::chrono::system_clock::now();
  write(string(), fmt::format("\n{:%FT%H:%M:%S} START\n", now));
}

Logger::~Logger() noexcept {
  async_active = false;

  // allow queued messages to drain then stop the writer thread
  guard.reset();
  if (thread.joinable()) thread.join();

  const auto now = std::chrono::system_clock::now();
  write(string(), fmt::format("\n{:%FT%H:%M:%S} STOP\n", now));

  std::lock_guard lck(out_mtx);
  if (out) out->close();
}

bool Logger::should_log(csv mod, csv cat) const noexcept {

  if ((cat == csv{"info"}) || tokc.empty()) return true;

  const auto &t = tokc.table();
  const auto mod_cat = fmt::format("{}.{}", mod, cat);

  std::array paths{cat, mod, csv{mod_cat}};

  return std::all_of(paths.begin(), paths.end(), [&t](const auto &p) {
    const auto node = t.at_path(p);

    return node.is_boolean() ? node.value_or(true) : true;
  });
}

void Logger::start() noexcept {
  thread = std::jthread([this]() {
    pthread_setname_np(pthread_self(), "homecast_log");

    io_ctx.run();
  });

  async_active = true;
}

void Logger::write(const string &prefix, const string &msg) noexcept {
  std::lock_guard lck(out_mtx);

  if (!out) return;

  try {
    if (prefix.empty()) {
      out->print("{}", msg);
    } else {
      out->print("{} {}", prefix, msg);
    }

    out->flush();
  } catch (const std::system_error &) {
    // the output is gone, stop writing
    out.reset();
  }
}

} // namespace homecast
