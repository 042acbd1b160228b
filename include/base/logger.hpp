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

#include "base/conf/token.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <fmt/os.h>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace homecast {

namespace asio = boost::asio;

class Logger;

extern std::unique_ptr<Logger> _logger;

class Logger {

public:
  using work_guard = asio::executor_work_guard<asio::io_context::executor_type>;

public:
  Logger() noexcept;
  Logger(const Logger &) = delete;
  Logger(Logger &&) = delete;

  ~Logger() noexcept;

  /// @brief Create the process wide Logger and start its writer thread.
  ///        Configuration is read from the [logger] table.
  static Logger *create() noexcept {
    _logger = std::make_unique<Logger>();
    _logger->start();

    return _logger.get();
  }

  template <typename... Args>
  void info(csv mod_id, csv cat, fmt::format_string<Args...> format, Args &&...args) {

    if (should_log(mod_id, cat)) {
      const auto runtime = e.as<millis_fp>();

      auto prefix = fmt::format(fmt::runtime(prefix_format), //
                                runtime.count(),              // millis since logger start
                                width_ts,                     // width of timestamp field
                                width_ts_precision,           // precision of timestamp
                                mod_id, width_mod,            // module_id + width
                                cat, width_cat);              // category + width

      auto msg = fmt::format(format, std::forward<Args>(args)...);

      if (msg.empty() || (msg.back() != '\n')) msg.append("\n");

      if (async_active && !io_ctx.stopped()) {
        asio::post(io_ctx, [this, prefix = std::move(prefix), msg = std::move(msg)]() {
          write(prefix, msg);
        });
      } else {
        write(prefix, msg);
      }
    }
  }

  /// @brief Should a message for module and category be logged?
  ///
  ///        order of precedence (all must allow):
  ///          1. logger.<cat>       == boolean
  ///          2. logger.<mod>       == boolean
  ///          3. logger.<mod>.<cat> == boolean
  bool should_log(csv mod, csv cat) const noexcept;

  /// @brief Stop and destroy the process wide Logger.
  ///        No other thread may log while shutdown is in progress.
  static void shutdown() noexcept { _logger.reset(); }

  /// @brief Write subsequent messages directly from the calling thread
  static void synchronous() noexcept {
    if (_logger) _logger->async_active = false;
  }

private:
  void start() noexcept;
  void write(const string &prefix, const string &msg) noexcept;

private:
  // order dependent
  conf::token tokc;
  asio::io_context io_ctx;
  work_guard guard;

  // order independent
  std::optional<fmt::ostream> out;
  std::mutex out_mtx;
  std::atomic_bool async_active{false};
  std::jthread thread;
  static Elapsed e;

public:
  static constexpr fmt::string_view prefix_format{"{:>{}.{}f} {:<{}} {:<{}}"};
  static constexpr int width_cat{15};
  static constexpr int width_mod{18};
  static constexpr int width_ts_precision{1};
  static constexpr int width_ts{13};

public:
  MOD_ID("logger");
};

#define INFO(__cat, format, ...)                                                                   \
  do {                                                                                             \
    if (homecast::_logger) homecast::_logger->info(module_id, __cat, format, ##__VA_ARGS__);       \
  } while (false)

#define INFO_AUTO_CAT(cat)                                                                         \
  static constexpr std::string_view fn_id { cat }

#define INFO_AUTO(format, ...)                                                                     \
  do {                                                                                             \
    if (homecast::_logger) homecast::_logger->info(module_id, fn_id, format, ##__VA_ARGS__);       \
  } while (false)

} // namespace homecast
