#pragma once

#include "fanout_cache/retry.hpp"
#include "fanout_cache/shard.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace fanout_cache {

using SweepCall = std::function<std::size_t(IShard &)>;

// Drives one sweep (expire, evict or clear) over every shard in index order.
// Each shard is called until a call removes nothing. A Timeout adds its
// partial count and repeats the same call on the same shard, so the result
// is exactly the number of items removed.
std::size_t sweep_shards(const std::vector<std::unique_ptr<IShard>> &shards,
                         const SweepCall &call, const Backoff &backoff = {});

} // namespace fanout_cache
