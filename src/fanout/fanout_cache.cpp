#include "fanout_cache/fanout_cache.hpp"

#include "fanout_cache/errors.hpp"
#include "fanout_cache/log.hpp"
#include "fanout_cache/sweep.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fanout_cache {
namespace {

std::string shard_dir(const std::string &base, std::size_t index) {
  return fmt::format("{}/{:03d}", base, index);
}

// Runs a stream-consuming shard call under `retry`. Every attempt starts
// from the stream position the caller handed in; streams that cannot seek
// are buffered first.
template <typename Call>
bool stream_call(std::istream &value, bool retry, const Backoff &backoff,
                 Call &&call) {
  std::stringstream buffered;
  std::istream *src = &value;
  if (retry && value.tellg() == std::istream::pos_type(-1)) {
    value.clear();
    buffered << value.rdbuf();
    buffered.clear();
    src = &buffered;
  }
  const auto origin = src->tellg();
  bool first = true;
  return call_with_retry(
      retry, backoff,
      [&] {
        if (!first) {
          src->clear();
          src->seekg(origin);
        }
        first = false;
        return call(*src);
      },
      [] { return false; });
}

} // namespace

FanoutCache::FanoutCache(std::string directory, CacheOptions opts)
    : directory_(std::move(directory)), opts_(std::move(opts)),
      router_(opts_.shards) {
  std::filesystem::create_directories(directory_);
  record_layout();
  if (!opts_.shard_factory) {
    opts_.shard_factory = [](std::size_t,
                             const DiskShardConfig &cfg) -> std::unique_ptr<IShard> {
      return std::make_unique<DiskShard>(cfg);
    };
  }

  shards_.reserve(opts_.shards);
  for (std::size_t i = 0; i < opts_.shards; ++i) {
    DiskShardConfig cfg;
    cfg.dir = shard_dir(directory_, i);
    cfg.timeout = opts_.timeout;
    cfg.settings = opts_.settings;
    shards_.push_back(opts_.shard_factory(i, cfg));
  }
  FANOUT_CACHE_LOG_INFO("opened {} with {} shards, timeout {} ms", directory_,
                        shards_.size(), opts_.timeout.count());
}

FanoutCache::~FanoutCache() { close(); }

bool FanoutCache::set(const std::string &key, const Bytes &value,
                      const SetOptions &opts) {
  CallPolicy policy = kNamedCall;
  policy.retry = opts.retry;
  return store(key, value, opts, policy);
}

bool FanoutCache::set(const std::string &key, std::istream &value,
                      const SetOptions &opts) {
  IShard &shard = shard_for(key);
  return stream_call(value, opts.retry, opts_.backoff, [&](std::istream &in) {
    return shard.set(key, in, opts.ttl_ms, opts.tag);
  });
}

void FanoutCache::assign(const std::string &key, const Bytes &value) {
  store(key, value, SetOptions{}, kSubscriptCall);
}

bool FanoutCache::add(const std::string &key, const Bytes &value,
                      const SetOptions &opts) {
  IShard &shard = shard_for(key);
  return call_with_retry(
      opts.retry, opts_.backoff,
      [&] { return shard.add(key, value, opts.ttl_ms, opts.tag); },
      [] { return false; });
}

bool FanoutCache::add(const std::string &key, std::istream &value,
                      const SetOptions &opts) {
  IShard &shard = shard_for(key);
  return stream_call(value, opts.retry, opts_.backoff, [&](std::istream &in) {
    return shard.add(key, in, opts.ttl_ms, opts.tag);
  });
}

std::optional<Item> FanoutCache::get(const std::string &key,
                                     const GetOptions &opts) {
  return lookup(key, opts);
}

Bytes FanoutCache::get(const std::string &key, const Bytes &default_value,
                       bool retry) {
  GetOptions opts;
  opts.retry = retry;
  auto item = lookup(key, opts);
  if (!item.has_value())
    return default_value;
  return std::move(item->value);
}

Bytes FanoutCache::at(const std::string &key) {
  auto item = lookup(key, GetOptions{});
  if (!item.has_value())
    throw NotFound(key);
  return std::move(item->value);
}

std::unique_ptr<std::istream> FanoutCache::read(const std::string &key) {
  GetOptions opts;
  opts.read = true;
  opts.retry = true;
  auto item = lookup(key, opts);
  if (!item.has_value())
    throw NotFound(key);
  return std::move(item->stream);
}

bool FanoutCache::contains(const std::string &key) {
  return shard_for(key).contains(key);
}

bool FanoutCache::del(const std::string &key, bool retry) {
  CallPolicy policy = kNamedCall;
  policy.retry = retry;
  return remove(key, policy);
}

void FanoutCache::erase(const std::string &key) { remove(key, kSubscriptCall); }

std::size_t FanoutCache::expire() {
  const TimePoint now = Clock::now();
  return sweep_shards(
      shards_, [now](IShard &shard) { return shard.expire(now); },
      opts_.backoff);
}

std::size_t FanoutCache::evict(const std::string &tag) {
  return sweep_shards(
      shards_, [&tag](IShard &shard) { return shard.evict(tag); },
      opts_.backoff);
}

std::size_t FanoutCache::clear() {
  return sweep_shards(
      shards_, [](IShard &shard) { return shard.clear(); }, opts_.backoff);
}

std::vector<std::string> FanoutCache::check(bool fix) {
  std::vector<std::string> warnings;
  for (auto &shard : shards_) {
    auto w = shard->check(fix);
    warnings.insert(warnings.end(), std::make_move_iterator(w.begin()),
                    std::make_move_iterator(w.end()));
  }
  return warnings;
}

HitStats FanoutCache::stats(bool enable, bool reset) {
  HitStats total;
  for (auto &shard : shards_) {
    const auto s = shard->stats(enable, reset);
    total.hits += s.hits;
    total.misses += s.misses;
  }
  return total;
}

std::uint64_t FanoutCache::volume() {
  std::uint64_t total = 0;
  for (auto &shard : shards_)
    total += shard->volume();
  return total;
}

std::size_t FanoutCache::size() {
  std::size_t total = 0;
  for (auto &shard : shards_)
    total += shard->size();
  return total;
}

std::string FanoutCache::reset(const std::string &key,
                               const std::optional<std::string> &value) {
  std::string result;
  for (auto &shard : shards_)
    result = retry_until_done(opts_.backoff,
                              [&] { return shard->reset(key, value); });
  return result;
}

void FanoutCache::create_tag_index() {
  for (auto &shard : shards_)
    shard->create_tag_index();
}

void FanoutCache::drop_tag_index() {
  for (auto &shard : shards_)
    shard->drop_tag_index();
}

Settings FanoutCache::settings() { return shards_.front()->settings(); }

void FanoutCache::close() {
  for (auto &shard : shards_)
    shard->close();
}

IShard &FanoutCache::shard_for(const std::string &key) {
  return *shards_[router_.route(key)];
}

bool FanoutCache::store(const std::string &key, const Bytes &value,
                        const SetOptions &opts, CallPolicy policy) {
  IShard &shard = shard_for(key);
  return call_with_retry(
      policy.retry, opts_.backoff,
      [&] { return shard.set(key, value, opts.ttl_ms, opts.tag); },
      [] { return false; });
}

bool FanoutCache::remove(const std::string &key, CallPolicy policy) {
  IShard &shard = shard_for(key);
  try {
    return call_with_retry(
        policy.retry, opts_.backoff,
        [&] {
          shard.del(key);
          return true;
        },
        [] { return false; });
  } catch (const NotFound &) {
    if (policy.propagate_not_found)
      throw;
    return false;
  }
}

std::optional<Item> FanoutCache::lookup(const std::string &key,
                                        const GetOptions &opts) {
  IShard &shard = shard_for(key);
  return call_with_retry(
      opts.retry, opts_.backoff, [&] { return shard.get(key, opts); },
      [] { return std::optional<Item>(); });
}

void FanoutCache::record_layout() {
  const std::string path = directory_ + "/fanout.txt";
  std::ifstream in(path);
  if (in.is_open()) {
    std::size_t shards = 0;
    std::string hash;
    std::string line;
    while (std::getline(in, line)) {
      if (line.rfind("shards=", 0) == 0) {
        try {
          shards = static_cast<std::size_t>(std::stoull(line.substr(7)));
        } catch (const std::exception &) {
          FANOUT_CACHE_LOG_WARN("malformed layout line in {}: {}", path, line);
        }
      } else if (line.rfind("hash=", 0) == 0) {
        hash = line.substr(5);
      }
    }
    if (shards != 0 && shards != opts_.shards)
      FANOUT_CACHE_LOG_WARN(
          "{} was created with {} shards but is opened with {}; existing keys "
          "may route to other shards",
          directory_, shards, opts_.shards);
    if (!hash.empty() && hash != kRouteHashName)
      FANOUT_CACHE_LOG_WARN("{} was written with routing hash {}, this build "
                            "uses {}",
                            directory_, hash, kRouteHashName);
    return;
  }
  std::ofstream out(path, std::ios::trunc);
  out << "shards=" << opts_.shards << "\n";
  out << "hash=" << kRouteHashName << "\n";
  if (!out)
    FANOUT_CACHE_LOG_WARN("could not record layout in {}", path);
}

} // namespace fanout_cache
