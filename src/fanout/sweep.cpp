#include "fanout_cache/sweep.hpp"

#include "fanout_cache/errors.hpp"
#include "fanout_cache/log.hpp"

namespace fanout_cache {

std::size_t sweep_shards(const std::vector<std::unique_ptr<IShard>> &shards,
                         const SweepCall &call, const Backoff &backoff) {
  std::size_t total = 0;
  for (std::size_t i = 0; i < shards.size(); ++i) {
    std::size_t timeouts = 0;
    while (true) {
      try {
        const std::size_t count = call(*shards[i]);
        total += count;
        if (count == 0)
          break;
      } catch (const Timeout &t) {
        total += t.count();
        ++timeouts;
        if (timeouts % kRetryLogInterval == 0)
          FANOUT_CACHE_LOG_WARN("sweep of shard {} timed out {} times", i,
                                timeouts);
        if (backoff)
          backoff(timeouts);
      }
    }
  }
  return total;
}

} // namespace fanout_cache
