#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fanout_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;

struct SetOptions {
  std::optional<std::uint64_t> ttl_ms;
  std::optional<std::string> tag;
  bool retry{false};
};

struct GetOptions {
  bool read{false};
  bool expire_time{false};
  bool tag{false};
  bool retry{false};
};

// Result of a lookup. `stream` replaces `value` when the caller asked to
// read; `expire_time` and `tag` are only filled in when requested.
struct Item {
  Bytes value;
  std::unique_ptr<std::istream> stream;
  std::optional<TimePoint> expire_time;
  std::optional<std::string> tag;
};

struct HitStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
};

inline std::int64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          t.time_since_epoch())
          .count());
}

// Saturates at TimePoint::max() for times the clock cannot represent.
inline TimePoint from_epoch_ms(std::int64_t ms) {
  constexpr auto kMaxMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          Clock::duration::max())
          .count();
  if (ms >= kMaxMs)
    return TimePoint::max();
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

} // namespace fanout_cache
