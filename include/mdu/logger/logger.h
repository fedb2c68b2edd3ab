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
 * Logger library for mdu.
 *
 * The logger is a process wide singleton with a shared implementation. It
 * writes to the console only, until a log file is opened with set_logfile().
 * The spdlog backend writes that file as JSON, so that the progress of long
 * running jobs can be processed afterwards.
 * */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "fmt/format.h"

namespace mdu::logger {

  enum class LogLevel : std::uint8_t {
    off = 0,
    trace,
    debug,
    info,
    default_level = info,
    warning,
    error,
    critical,
  };

  // Parse a level name ("off", "trace", "debug", "info", "warning", "error",
  // "critical"). Case insensitive, "warn" is accepted as well.
  std::optional<LogLevel> parse_log_level(std::string_view name);

  class Logger final {
   public:
    ~Logger() = default;

    // Copy is cheap, because of the shared implementation.
    Logger(const Logger &) = default;
    Logger &operator=(const Logger &) = default;

    Logger(Logger &&) noexcept = delete;
    Logger &operator=(Logger &&) noexcept = delete;

    /**
     * @brief Set the minimum level for the logger implementation. Messages
     * with a level below will be ignored.
     */
    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * @brief Also write all messages to the file at path, replacing the
     * current log file if there is one.
     *
     * Returns false and keeps logging to the console only when the file
     * cannot be opened. Not safe to call while other threads are logging.
     */
    bool set_logfile(const std::string &path);
    /** @brief Finalize and close the log file, if one is open. */
    void close_logfile();

    /** @brief Returns a reference to the single logger instance. */
    static Logger &get_logger();

    /**
     * @brief Trace is used for logging counts on a process, eg. the number of
     * binned points or resolved buildings.
     *
     * The trace message is a string that contains a valid JSON object with the
     * "name" and "count" members.
     */
    void trace(std::string_view name, size_t count) {
      log(LogLevel::trace,
          fmt::format(R"({{\"name\":\"{}\",\"count\":{}}})", name, count));
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::debug, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::info, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::warning, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::error, fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

    template <typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args &&...args) {
      log(LogLevel::critical,
          fmt::vformat(fmt, fmt::make_format_args(args...)));
    }

   private:
    Logger() = default;

    struct logger_impl;
    std::shared_ptr<logger_impl> impl_;

    void log(LogLevel level, std::string_view message);
  };

}  // namespace mdu::logger
