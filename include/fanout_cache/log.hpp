#pragma once

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <string>

namespace fanout_cache {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

// Process-wide threshold. Starts from FANOUT_CACHE_LOG_LEVEL, else Warn.
LogLevel log_level();
void set_log_level(LogLevel level);
bool parse_log_level(const std::string &name, LogLevel &out);

inline bool log_enabled(LogLevel level) {
  return level >= log_level() && log_level() != LogLevel::Off;
}

} // namespace fanout_cache

#define FANOUT_CACHE_LOG_TRACE(MSG, ...)                                       \
  do {                                                                         \
    if (::fanout_cache::log_enabled(::fanout_cache::LogLevel::Trace))          \
      fmt::print(stderr, "[TRC {}:{} {}] " MSG "\n", __FILE__, __LINE__,       \
                 __func__, ##__VA_ARGS__);                                     \
  } while (0)

#define FANOUT_CACHE_LOG_DEBUG(MSG, ...)                                       \
  do {                                                                         \
    if (::fanout_cache::log_enabled(::fanout_cache::LogLevel::Debug))          \
      fmt::print(stderr, fg(fmt::terminal_color::magenta),                     \
                 "[DBG {}:{} {}] " MSG "\n", __FILE__, __LINE__, __func__,     \
                 ##__VA_ARGS__);                                               \
  } while (0)

#define FANOUT_CACHE_LOG_INFO(MSG, ...)                                        \
  do {                                                                         \
    if (::fanout_cache::log_enabled(::fanout_cache::LogLevel::Info))           \
      fmt::print(stderr, fg(fmt::terminal_color::cyan),                        \
                 "[INFO {}:{} {}] " MSG "\n", __FILE__, __LINE__, __func__,    \
                 ##__VA_ARGS__);                                               \
  } while (0)

#define FANOUT_CACHE_LOG_WARN(MSG, ...)                                        \
  do {                                                                         \
    if (::fanout_cache::log_enabled(::fanout_cache::LogLevel::Warn))           \
      fmt::print(stderr,                                                       \
                 fg(fmt::terminal_color::yellow) | fmt::emphasis::bold,        \
                 "[WARN {}:{} {}] " MSG "\n", __FILE__, __LINE__, __func__,    \
                 ##__VA_ARGS__);                                               \
  } while (0)

#define FANOUT_CACHE_LOG_ERROR(MSG, ...)                                       \
  do {                                                                         \
    if (::fanout_cache::log_enabled(::fanout_cache::LogLevel::Error))          \
      fmt::print(stderr, fg(fmt::terminal_color::red) | fmt::emphasis::bold,   \
                 "[ERR {}:{} {}] " MSG "\n", __FILE__, __LINE__, __func__,     \
                 ##__VA_ARGS__);                                               \
  } while (0)
