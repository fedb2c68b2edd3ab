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
 * spdlog logging backend implementation.
 * Logs messages to stdout, stderr and optionally to a file.
 * The log file is a JSON file.
 */
#ifdef MDU_USE_LOGGER_SPDLOG

#include <mdu/logger/logger.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace mdu::logger {
  spdlog::level::level_enum cast_level(LogLevel level) {
    switch (level) {
      case LogLevel::off:
        return spdlog::level::off;
      case LogLevel::trace:
        return spdlog::level::trace;
      case LogLevel::debug:
        return spdlog::level::debug;
      case LogLevel::info:
        return spdlog::level::info;
      case LogLevel::warning:
        return spdlog::level::warn;
      case LogLevel::error:
        return spdlog::level::err;
      case LogLevel::critical:
        return spdlog::level::critical;
    }
    return spdlog::level::off;
  }

  namespace {
    const std::string jsonpattern = {
        R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%^%l%$", "process": %P, "thread": %t, "message": "%v"},)"};
    const std::string jsonlastlogpattern = {
        R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%^%l%$", "process": %P, "thread": %t, "message": "%v"})"};

    // Write one message straight to the sink, regardless of its level.
    void write_raw(spdlog::sinks::sink &sink, const std::string &pattern,
                   std::string_view message = "") {
      sink.set_pattern(pattern);
      spdlog::details::log_msg msg("stdout", spdlog::level::critical, message);
      sink.log(msg);
    }
  }  // namespace

  struct Logger::logger_impl {
    LogLevel level = LogLevel::default_level;

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink =
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;

    spdlog::logger logger_stdout = spdlog::logger("stdout", stdout_sink);
    spdlog::logger logger_stderr = spdlog::logger("stderr", stderr_sink);

    logger_impl() { set_level(level); }

    ~logger_impl() { close_logfile(); }

    bool open_logfile(const std::string &path) {
      std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
      try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
      } catch (const spdlog::spdlog_ex &e) {
        logger_stdout.warn("Cannot open log file {}, logging to the console "
                           "only: {}",
                           path, e.what());
        return false;
      }
      close_logfile();
      sink->set_level(cast_level(level));
      // Open the json array in the logfile.
      write_raw(*sink, "{\n \"log\": [");
      sink->set_pattern(jsonpattern);
      logger_stdout.sinks().push_back(sink);
      logger_stderr.sinks().push_back(sink);
      file_sink = sink;
      return true;
    }

    void close_logfile() {
      if (!file_sink) return;
      // Finalize the json logfile.
      write_raw(*file_sink, jsonlastlogpattern, "Finished.");
      write_raw(*file_sink, "]\n}");
      file_sink->flush();
      std::erase(logger_stdout.sinks(), file_sink);
      std::erase(logger_stderr.sinks(), file_sink);
      file_sink.reset();
    }

    void set_level(LogLevel new_level) {
      level = new_level;
      auto spdlog_level = cast_level(new_level);
      stdout_sink->set_level(spdlog_level);
      stderr_sink->set_level(spdlog_level);
      if (file_sink) file_sink->set_level(spdlog_level);
      logger_stdout.set_level(spdlog_level);
      logger_stderr.set_level(spdlog_level);
    }
  };

  void Logger::set_level(LogLevel level) {
    if (impl_) impl_->set_level(level);
  }

  LogLevel Logger::get_level() const {
    return impl_ ? impl_->level : LogLevel::off;
  }

  bool Logger::set_logfile(const std::string &path) {
    return impl_ && impl_->open_logfile(path);
  }

  void Logger::close_logfile() {
    if (impl_) impl_->close_logfile();
  }

  Logger &Logger::get_logger() {
    static Logger singleton;
    if (!singleton.impl_) {
      auto impl = std::make_shared<Logger::logger_impl>();
      singleton.impl_ = impl;
    }
    return singleton;
  }

  void Logger::log(LogLevel level, std::string_view message) {
    if (!impl_) return;
    switch (level) {
      case LogLevel::off:
        return;
      case LogLevel::trace:
        impl_->logger_stdout.trace(message);
        return;
      case LogLevel::debug:
        impl_->logger_stdout.debug(message);
        return;
      case LogLevel::info:
        impl_->logger_stdout.info(message);
        return;
      case LogLevel::warning:
        impl_->logger_stdout.warn(message);
        return;
      case LogLevel::error:
        impl_->logger_stderr.error(message);
        return;
      case LogLevel::critical:
        impl_->logger_stderr.critical(message);
        return;
    }
  }

}  // namespace mdu::logger
#endif
