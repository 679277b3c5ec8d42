#pragma once

#include "fanout_cache/errors.hpp"
#include "fanout_cache/log.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <utility>

namespace fanout_cache {

// Called between attempts of a retried shard call. An empty Backoff retries
// immediately.
using Backoff = std::function<void(std::size_t attempt)>;

// Sleeps base * 2^(attempt-1), capped at `cap`.
Backoff exponential_backoff(std::chrono::microseconds base,
                            std::chrono::microseconds cap);

// How a single-key operation treats Timeout and NotFound from its shard.
struct CallPolicy {
  bool retry;
  bool propagate_not_found;
};

// set/add/get/del: caller picks retry, missing keys become a plain result.
inline constexpr CallPolicy kNamedCall{false, false};
// assign/erase: retry until the shard answers, missing keys throw.
inline constexpr CallPolicy kSubscriptCall{true, true};

inline constexpr std::size_t kRetryLogInterval = 10000;

// Runs `call`. On Timeout returns `no_effect()` unless `retry` is set, in
// which case the same call is repeated until it returns or throws something
// other than Timeout.
template <typename Call, typename NoEffect>
auto call_with_retry(bool retry, const Backoff &backoff, Call &&call,
                     NoEffect &&no_effect) -> decltype(call()) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return call();
    } catch (const Timeout &) {
      if (!retry)
        return no_effect();
      if (attempt % kRetryLogInterval == 0)
        FANOUT_CACHE_LOG_WARN("shard call still timing out after {} attempts",
                              attempt);
      if (backoff)
        backoff(attempt);
    }
  }
}

template <typename Call>
auto retry_until_done(const Backoff &backoff, Call &&call) -> decltype(call()) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return call();
    } catch (const Timeout &) {
      if (attempt % kRetryLogInterval == 0)
        FANOUT_CACHE_LOG_WARN("shard call still timing out after {} attempts",
                              attempt);
      if (backoff)
        backoff(attempt);
    }
  }
}

} // namespace fanout_cache
