#pragma once
#include "pl-gpib/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace plgpib {

/// Centralized logging with component and operation context
class PL_GPIB_API BusLogger {
public:
  static BusLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "pl_gpib.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("pl-gpib", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("pl-gpib")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &op,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &op,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  BusLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &op, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [op] message
    std::string prefix = fmt::format("[{}] [{}] ", component, op);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(ctx, op, ...)                                                \
  plgpib::BusLogger::instance().trace(ctx, op, __VA_ARGS__)
#define LOG_DEBUG(ctx, op, ...)                                                \
  plgpib::BusLogger::instance().debug(ctx, op, __VA_ARGS__)
#define LOG_INFO(ctx, op, ...)                                                 \
  plgpib::BusLogger::instance().info(ctx, op, __VA_ARGS__)
#define LOG_WARN(ctx, op, ...)                                                 \
  plgpib::BusLogger::instance().warn(ctx, op, __VA_ARGS__)
#define LOG_ERROR(ctx, op, ...)                                                \
  plgpib::BusLogger::instance().error(ctx, op, __VA_ARGS__)

} // namespace plgpib
