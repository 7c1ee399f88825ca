/**
 * @file logging.cpp
 * @brief Logging utilities implementation
 *
 * @details Provides definitions for:
 *          - Global log mutex
 *
 *          - Runtime log level (parsed once from RUNPOD_LOG_LEVEL)
 *
 *          - Timestamp formatting for log lines
 */

#include "projectm_pod/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>

#include "projectm_pod/config.hpp"

namespace projectm_pod {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- LOG LEVEL -----**

namespace {

std::atomic<int> &level_override() {
  static std::atomic<int> val{-1};
  return val;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG" || upper == "TRACE")
    return LogLevel::Debug;
  if (upper == "WARNING" || upper == "WARN")
    return LogLevel::Warn;
  if (upper == "ERROR" || upper == "CRITICAL")
    return LogLevel::Error;
  return LogLevel::Info;
}

LogLevel log_level() {
  int forced = level_override().load(std::memory_order_relaxed);
  if (forced >= 0)
    return static_cast<LogLevel>(forced);
  static LogLevel from_env = parse_log_level(Config::log_level());
  return from_env;
}

void set_log_level(LogLevel level) {
  level_override().store(static_cast<int>(level), std::memory_order_relaxed);
}

std::string log_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return std::string(buf, n);
}

} // namespace projectm_pod
