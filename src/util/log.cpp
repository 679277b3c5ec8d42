#include "fanout_cache/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>

namespace fanout_cache {
namespace {

LogLevel initial_level() {
  LogLevel level = LogLevel::Warn;
  const char *env = std::getenv("FANOUT_CACHE_LOG_LEVEL");
  if (env != nullptr && !parse_log_level(env, level))
    fmt::print(stderr, "ignoring unknown FANOUT_CACHE_LOG_LEVEL '{}'\n", env);
  return level;
}

std::atomic<LogLevel> &level_slot() {
  static std::atomic<LogLevel> level{initial_level()};
  return level;
}

} // namespace

LogLevel log_level() { return level_slot().load(std::memory_order_relaxed); }

void set_log_level(LogLevel level) {
  level_slot().store(level, std::memory_order_relaxed);
}

bool parse_log_level(const std::string &name, LogLevel &out) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "trace")
    out = LogLevel::Trace;
  else if (s == "debug")
    out = LogLevel::Debug;
  else if (s == "info")
    out = LogLevel::Info;
  else if (s == "warn" || s == "warning")
    out = LogLevel::Warn;
  else if (s == "error")
    out = LogLevel::Error;
  else if (s == "off")
    out = LogLevel::Off;
  else
    return false;
  return true;
}

} // namespace fanout_cache
