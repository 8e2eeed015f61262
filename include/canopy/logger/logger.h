// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of canopy, which is based on roofer
// (https://github.com/3DBAG/roofer)

// canopy is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. canopy is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with canopy. If not, see <https://www.gnu.org/licenses/>.

/**
 * Logger for canopy.
 *
 * Uses spdlog as backend. The logger is thread-safe and writes every message
 * to the console and to a JSON log file (canopy.log.json), so that batch runs
 * can be inspected afterwards.
 * */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "fmt/format.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace canopy::logger {

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

  inline std::string_view to_string(LogLevel level) {
    switch (level) {
      case LogLevel::off:
        return "off";
      case LogLevel::trace:
        return "trace";
      case LogLevel::debug:
        return "debug";
      case LogLevel::info:
        return "info";
      case LogLevel::warning:
        return "warning";
      case LogLevel::error:
        return "error";
      case LogLevel::critical:
        return "critical";
    }
    return "unknown";
  }

  inline std::optional<LogLevel> level_from_string(std::string_view name) {
    for (auto level : {LogLevel::off, LogLevel::trace, LogLevel::debug,
                       LogLevel::info, LogLevel::warning, LogLevel::error,
                       LogLevel::critical}) {
      if (to_string(level) == name) return level;
    }
    return std::nullopt;
  }

  class Logger final {
   public:
    ~Logger() = default;

    // Copy is cheap, because of the shared implementation.
    Logger(const Logger &) = default;
    Logger &operator=(const Logger &) = default;

    Logger(Logger &&) noexcept = delete;
    Logger &operator=(Logger &&) noexcept = delete;

    /**
     * @brief Set the minimum level. Messages with a lower level are ignored.
     */
    void set_level(LogLevel level) {
      if (impl_) {
        impl_->set_level(level);
      }
    }

    LogLevel get_level() const {
      return impl_ ? impl_->level : LogLevel::off;
    }

    /** @brief Returns a reference to the single logger instance. */
    static Logger &get_logger() {
      static Logger singleton;
      static std::once_flag init_flag;
      std::call_once(init_flag, [] {
        singleton.impl_ = std::make_shared<Logger::logger_impl>();
      });
      return singleton;
    }

    /**
     * @brief Log a progress count, eg. the number of processed locations.
     *
     * The message is a JSON object with the "name" and "count" members.
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
    inline static const std::string logfile_path_{"canopy.log.json"};

    Logger() = default;

    struct logger_impl {
      LogLevel level = LogLevel::default_level;

      std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      std::shared_ptr<spdlog::sinks::basic_file_sink<std::mutex>> file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile_path_,
                                                              true);

      spdlog::logger logger_stdout =
          spdlog::logger("stdout", {stdout_sink, file_sink});
      spdlog::logger logger_stderr =
          spdlog::logger("stderr", {stderr_sink, file_sink});

      logger_impl() {
        set_level(level);
        std::string jsonpattern = {
            R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%^%l%$", "process": %P, "thread": %t, "message": "%v"},)"};
        file_sink->set_pattern(jsonpattern);
      }

      ~logger_impl() { spdlog::drop_all(); }

      void set_level(LogLevel new_level) {
        level = new_level;
        auto spdlog_level = cast_level(new_level);
        stdout_sink->set_level(spdlog_level);
        stderr_sink->set_level(spdlog_level);
        file_sink->set_level(spdlog_level);
        logger_stdout.set_level(spdlog_level);
        logger_stderr.set_level(spdlog_level);
      }

      static spdlog::level::level_enum cast_level(LogLevel level) {
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
    };
    std::shared_ptr<logger_impl> impl_;

    void log(LogLevel level, std::string_view message) {
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
  };

}  // namespace canopy::logger
