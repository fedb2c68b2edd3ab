// Copyright (c) 2024-2026 The mdu authors

// This file is part of mdu

// mdu is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. mdu is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details. You should have received a copy of the GNU General Public
// License along with mdu. If not, see <https://www.gnu.org/licenses/>.

/**
 * Internal logging backend implementation, used when mdu is built without
 * spdlog. Logs all messages to stdout, errors to stderr, and optionally as
 * plain text lines to a file.
 *
 * parse_log_level is shared by both backends.
 */
#include <mdu/common/common.hpp>
#include <mdu/logger/logger.h>

namespace mdu::logger {
  std::optional<LogLevel> parse_log_level(std::string_view name) {
    auto lname = to_lower(std::string(name));
    if (lname == "off") return LogLevel::off;
    if (lname == "trace") return LogLevel::trace;
    if (lname == "debug") return LogLevel::debug;
    if (lname == "info") return LogLevel::info;
    if (lname == "warning" || lname == "warn") return LogLevel::warning;
    if (lname == "error") return LogLevel::error;
    if (lname == "critical") return LogLevel::critical;
    return std::nullopt;
  }
}  // namespace mdu::logger

#if !defined(MDU_USE_LOGGER_SPDLOG)

#include <fmt/chrono.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <utility>

namespace {
  /** @brief Convert the log level into string */
  std::string_view string_from_log_level(mdu::logger::LogLevel level) {
    static const std::array<std::string_view, 7> names = {
        "OFF", "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
    return names[static_cast<size_t>(level)];
  }

  /** @brief Get current time, for printing into the log */
  std::string get_now_string() {
    return fmt::format("{:%F %T}", std::chrono::system_clock::now());
  }
}  // namespace

namespace mdu::logger {
  struct Logger::logger_impl {
    LogLevel level = LogLevel::default_level;

    std::mutex write_mutex;  // serializes writes to all streams
    std::ofstream logfile;

    void write(LogLevel log_level, std::string_view message) {
      auto line = fmt::format("[{}]\t{}\t{}\n", get_now_string(),
                              string_from_log_level(log_level), message);
      std::scoped_lock lock{write_mutex};
      std::FILE* stream = log_level >= LogLevel::error ? stderr : stdout;
      fmt::print(stream, "{}", line);
      if (logfile.is_open()) logfile << line;
    }

    bool open_logfile(const std::string& path) {
      std::ofstream file(path, std::ios::trunc);
      if (!file.is_open()) {
        write(LogLevel::warning,
              fmt::format("Cannot open log file {}, logging to the console "
                          "only",
                          path));
        return false;
      }
      std::scoped_lock lock{write_mutex};
      logfile = std::move(file);
      return true;
    }

    void close_logfile() {
      std::scoped_lock lock{write_mutex};
      if (!logfile.is_open()) return;
      logfile << fmt::format("[{}]\t{}\tFinished.\n", get_now_string(),
                             string_from_log_level(level));
      logfile.close();
    }
  };

  void Logger::set_level(LogLevel level) {
    if (impl_) impl_->level = level;
  }

  LogLevel Logger::get_level() const {
    return impl_ ? impl_->level : LogLevel::off;
  }

  bool Logger::set_logfile(const std::string& path) {
    return impl_ && impl_->open_logfile(path);
  }

  void Logger::close_logfile() {
    if (impl_) impl_->close_logfile();
  }

  Logger& Logger::get_logger() {
    static Logger singleton;
    if (!singleton.impl_) {
      auto impl = std::make_shared<Logger::logger_impl>();
      singleton.impl_ = impl;
    }
    return singleton;
  }

  void Logger::log(LogLevel level, std::string_view message) {
    if (!impl_ || level == LogLevel::off || impl_->level == LogLevel::off ||
        impl_->level > level) {
      return;
    }
    impl_->write(level, message);
  }

}  // namespace mdu::logger
#endif
