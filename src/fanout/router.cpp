#include "fanout_cache/router.hpp"

#include "fanout_cache/hash.hpp"

#include <stdexcept>

namespace fanout_cache {

std::uint64_t route_hash(std::string_view key) { return fnv1a64(key); }

ShardRouter::ShardRouter(std::size_t shard_count) : count_(shard_count) {
  if (count_ == 0)
    throw std::invalid_argument("shard count must be at least 1");
}

std::size_t ShardRouter::route(std::string_view key) const {
  return static_cast<std::size_t>(route_hash(key) % count_);
}

} // namespace fanout_cache
