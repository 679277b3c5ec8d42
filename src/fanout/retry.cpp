#include "fanout_cache/retry.hpp"

#include <algorithm>
#include <thread>

namespace fanout_cache {

Backoff exponential_backoff(std::chrono::microseconds base,
                            std::chrono::microseconds cap) {
  return [base, cap](std::size_t attempt) {
    const auto shift = std::min<std::size_t>(attempt - 1, 20);
    const auto delay = std::min<std::chrono::microseconds>(
        cap, base * (std::chrono::microseconds::rep{1} << shift));
    std::this_thread::sleep_for(delay);
  };
}

} // namespace fanout_cache
