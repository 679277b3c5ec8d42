#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fanout_cache {

// Bump when route_hash changes; data written under another version routes
// to different shards.
constexpr int kRouteHashVersion = 1;
constexpr const char *kRouteHashName = "fnv1a64-v1";

std::uint64_t route_hash(std::string_view key);

class ShardRouter {
public:
  explicit ShardRouter(std::size_t shard_count);

  std::size_t route(std::string_view key) const;
  std::size_t shard_count() const { return count_; }

private:
  std::size_t count_;
};

} // namespace fanout_cache
