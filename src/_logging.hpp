#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace dynhash {

// ----------------------------------------------------------------------------------------- LogLevel

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

constexpr std::string_view to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "trace";
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Off:
    return "off";
  }
  return "unknown";
}

/**
 * @return The level named by `name`, or `fallback` if `name` is not a level
 */
constexpr LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
  for (auto i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
    const auto level = static_cast<LogLevel>(i);
    if (to_string(level) == name)
      return level;
  }
  return fallback;
}

namespace detail {
  inline LogLevel initial_log_level() {
    const char* env = std::getenv("DYNHASH_LOG_LEVEL");
    return (env == nullptr) ? LogLevel::Warn : parse_log_level(env, LogLevel::Warn);
  }

  inline std::atomic<LogLevel>& log_level_ref() {
    static std::atomic<LogLevel> level{initial_log_level()};
    return level;
  }
} // namespace detail

//@{ Log level
inline LogLevel log_level() { return detail::log_level_ref().load(std::memory_order_relaxed); }

inline void set_log_level(LogLevel level) {
  detail::log_level_ref().store(level, std::memory_order_relaxed);
}

inline bool is_logging(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(log_level());
}
//@}

/**
 * Formats and writes one line to stderr, if `level` passes the current filter
 *
 * ~~~
 * dynhash::log(LogLevel::Warn, "capacity {} clamped to {}", capacity, 3);
 * // [dynhash warn] capacity 1 clamped to 3
 * ~~~
 */
template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
  if (!is_logging(level))
    return;
  fmt::print(stderr, "[dynhash {}] {}\n", to_string(level),
             fmt::format(format, std::forward<Args>(args)...));
}

} // namespace dynhash
