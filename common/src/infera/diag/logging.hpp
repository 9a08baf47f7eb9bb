#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace infera::diag {

enum class LogLevel {
  Off,
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::logger &infera_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("infera");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("infera", sink);
      lg->set_level(spdlog::level::warn);
      lg->set_pattern("[%^%-5l%$ \x1B[4m%s:%#\x1B[0m] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

inline void set_log_level(LogLevel level) {
  spdlog::level::level_enum lvl = spdlog::level::warn;
  switch (level) {
  case LogLevel::Off:
    lvl = spdlog::level::off;
    break;
  case LogLevel::Error:
    lvl = spdlog::level::err;
    break;
  case LogLevel::Warn:
    lvl = spdlog::level::warn;
    break;
  case LogLevel::Info:
    lvl = spdlog::level::info;
    break;
  case LogLevel::Debug:
    lvl = spdlog::level::debug;
    break;
  case LogLevel::Trace:
    lvl = spdlog::level::trace;
    break;
  }
  infera_logger().set_level(lvl);
}

// SPDLOG_LOGGER_CALL fills in the source location for the %s:%# pattern.
#define INFERA_TRACE(...)                                                      \
  SPDLOG_LOGGER_CALL(&::infera::diag::infera_logger(), spdlog::level::trace,   \
                     __VA_ARGS__)
#define INFERA_DEBUG(...)                                                      \
  SPDLOG_LOGGER_CALL(&::infera::diag::infera_logger(), spdlog::level::debug,   \
                     __VA_ARGS__)
#define INFERA_INFO(...)                                                       \
  SPDLOG_LOGGER_CALL(&::infera::diag::infera_logger(), spdlog::level::info,    \
                     __VA_ARGS__)
#define INFERA_WARN(...)                                                       \
  SPDLOG_LOGGER_CALL(&::infera::diag::infera_logger(), spdlog::level::warn,    \
                     __VA_ARGS__)
#define INFERA_ERROR(...)                                                      \
  SPDLOG_LOGGER_CALL(&::infera::diag::infera_logger(), spdlog::level::err,     \
                     __VA_ARGS__)

} // namespace infera::diag
