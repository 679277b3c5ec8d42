#pragma once

#include "fanout_cache/disk_shard.hpp"
#include "fanout_cache/retry.hpp"
#include "fanout_cache/router.hpp"
#include "fanout_cache/settings.hpp"
#include "fanout_cache/shard.hpp"
#include "fanout_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fanout_cache {

using ShardFactory = std::function<std::unique_ptr<IShard>(
    std::size_t index, const DiskShardConfig &cfg)>;

struct CacheOptions {
  std::size_t shards{8};
  std::chrono::milliseconds timeout{25};
  // Forwarded unchanged to every shard.
  SettingsOverrides settings;
  // Pause between retries of a timed-out shard call; empty retries at once.
  Backoff backoff;
  // Builds shard `index`; defaults to a DiskShard in `cfg.dir`.
  ShardFactory shard_factory;
};

// Cache that spreads keys over a fixed set of shards under one directory.
// Shard i lives in `<directory>/<i as %03d>`. The shard count must not change
// once data exists: keys would route to other shards.
class FanoutCache {
public:
  explicit FanoutCache(std::string directory, CacheOptions opts = {});
  ~FanoutCache();

  FanoutCache(const FanoutCache &) = delete;
  FanoutCache &operator=(const FanoutCache &) = delete;

  bool set(const std::string &key, const Bytes &value,
           const SetOptions &opts = {});
  bool set(const std::string &key, std::istream &value,
           const SetOptions &opts = {});
  // Like set, but retries until the shard answers.
  void assign(const std::string &key, const Bytes &value);

  // Stores only if the key is absent. Among concurrent adds of one key, from
  // any thread or process, at most one returns true.
  bool add(const std::string &key, const Bytes &value,
           const SetOptions &opts = {});
  bool add(const std::string &key, std::istream &value,
           const SetOptions &opts = {});

  // std::nullopt on a miss, or on a timeout when retry is off.
  std::optional<Item> get(const std::string &key, const GetOptions &opts = {});
  Bytes get(const std::string &key, const Bytes &default_value,
            bool retry = false);
  // Throw NotFound on a miss.
  Bytes at(const std::string &key);
  std::unique_ptr<std::istream> read(const std::string &key);

  // Not retried; a Timeout reaches the caller.
  bool contains(const std::string &key);

  bool del(const std::string &key, bool retry = false);
  // Retries until the shard answers; throws NotFound for a missing key.
  void erase(const std::string &key);

  std::size_t expire();
  std::size_t evict(const std::string &tag);
  std::size_t clear();

  std::vector<std::string> check(bool fix = false);
  HitStats stats(bool enable = true, bool reset = false);
  std::uint64_t volume();
  std::size_t size();

  // Updates (or with no value, reloads) a setting on every shard and returns
  // the value reported by the last shard.
  std::string reset(const std::string &key,
                    const std::optional<std::string> &value = std::nullopt);
  void create_tag_index();
  void drop_tag_index();
  Settings settings();

  void close();

  std::size_t shard_count() const { return shards_.size(); }
  std::size_t shard_index(const std::string &key) const {
    return router_.route(key);
  }

private:
  IShard &shard_for(const std::string &key);
  bool store(const std::string &key, const Bytes &value,
             const SetOptions &opts, CallPolicy policy);
  bool remove(const std::string &key, CallPolicy policy);
  std::optional<Item> lookup(const std::string &key, const GetOptions &opts);
  void record_layout();

  std::string directory_;
  CacheOptions opts_;
  ShardRouter router_;
  std::vector<std::unique_ptr<IShard>> shards_;
};

} // namespace fanout_cache
