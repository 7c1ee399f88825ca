/**
 * @file logging.hpp
 * @brief Logging macros
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime level threshold read from RUNPOD_LOG_LEVEL
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately to ensure visibility in container logs. Logs go to
 *       stderr because stdout carries job result records.
 *
 */

#ifndef PROJECTM_POD_LOGGING_HPP
#define PROJECTM_POD_LOGGING_HPP

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace projectm_pod {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

enum class LogLevel : uint8_t { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR).
 * @note Unknown names map to Info.
 */
LogLevel parse_log_level(const std::string &name);

/**
 * @brief Current threshold (RUNPOD_LOG_LEVEL unless overridden).
 */
LogLevel log_level();

/// Override the threshold (used by tests and the CLI --verbose flag).
void set_log_level(LogLevel level);

inline bool log_enabled(LogLevel level) {
  return static_cast<uint8_t>(level) <= static_cast<uint8_t>(log_level());
}

/// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string log_timestamp();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define PROJECTM_POD_LOG_(level, style, tag, format_str, ...)                  \
  do {                                                                         \
    if (projectm_pod::log_enabled(level)) {                                    \
      std::lock_guard<std::mutex> lock(projectm_pod::log_mutex);               \
      fmt::print(stderr, style, "{} " tag format_str "\n",                     \
                 projectm_pod::log_timestamp(), ##__VA_ARGS__);                \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Debug, fmt::text_style(),          \
                    "[DEBUG] ", format_str, ##__VA_ARGS__)

#define LOG_INFO(format_str, ...)                                              \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Info, fmt::text_style(),           \
                    "[INFO] ", format_str, ##__VA_ARGS__)

#define LOG_WARN(format_str, ...)                                              \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Warn, fg(fmt::color::yellow),      \
                    "[WARN] ", format_str, ##__VA_ARGS__)

#define LOG_ERROR(format_str, ...)                                             \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Error, fg(fmt::color::red),        \
                    "[ERROR] ", format_str, ##__VA_ARGS__)

#define LOG_PHASE(format_str, ...)                                             \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Info, fg(fmt::color::cyan),        \
                    "[INFO] ", format_str, ##__VA_ARGS__)

#define LOG_SUCCESS(format_str, ...)                                           \
  PROJECTM_POD_LOG_(projectm_pod::LogLevel::Info, fg(fmt::color::green),       \
                    "[INFO] ", format_str, ##__VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace projectm_pod

#endif // PROJECTM_POD_LOGGING_HPP
