#pragma once

#include "fanout_cache/errors.hpp"
#include "fanout_cache/fanout_cache.hpp"
#include "fanout_cache/shard.hpp"

#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fanout_cache::testing {

// In-memory shard whose calls can be scripted to time out. Each entry in a
// script is consumed by one call: a value >= 0 is returned as the call's
// result (sweeps), -1 makes the call throw Timeout with `partial`.
struct ScriptedSweep {
  long result;
  std::size_t partial{0};
};

class FakeShard final : public IShard {
public:
  struct Entry {
    Bytes value;
    std::optional<std::uint64_t> ttl_ms;
    std::optional<std::string> tag;
  };

  bool set(const std::string &key, const Bytes &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override {
    ++calls;
    maybe_time_out();
    data[key] = Entry{value, ttl_ms, tag};
    return true;
  }
  bool set(const std::string &key, std::istream &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override {
    return set(key, drain(value), ttl_ms, tag);
  }
  bool add(const std::string &key, const Bytes &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override {
    ++calls;
    maybe_time_out();
    if (data.contains(key))
      return false;
    data[key] = Entry{value, ttl_ms, tag};
    return true;
  }
  bool add(const std::string &key, std::istream &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override {
    return add(key, drain(value), ttl_ms, tag);
  }
  std::optional<Item> get(const std::string &key,
                          const GetOptions &opts) override {
    ++calls;
    maybe_time_out();
    auto it = data.find(key);
    if (it == data.end())
      return std::nullopt;
    Item item;
    if (opts.read)
      item.stream = std::make_unique<std::istringstream>(
          std::string(it->second.value.begin(), it->second.value.end()));
    else
      item.value = it->second.value;
    if (opts.tag)
      item.tag = it->second.tag;
    return item;
  }
  void del(const std::string &key) override {
    ++calls;
    maybe_time_out();
    if (data.erase(key) == 0)
      throw NotFound(key);
  }
  bool contains(const std::string &key) override {
    ++calls;
    maybe_time_out();
    return data.contains(key);
  }

  std::size_t expire(TimePoint now) override {
    expire_times.push_back(now);
    return next_sweep();
  }
  std::size_t evict(const std::string &tag) override {
    evicted_tags.push_back(tag);
    return next_sweep();
  }
  std::size_t clear() override { return next_sweep(); }

  std::vector<std::string> check(bool) override { return warnings; }
  HitStats stats(bool, bool) override { return hit_stats; }
  std::uint64_t volume() override { return bytes; }
  std::size_t size() override {
    maybe_time_out();
    return data.size();
  }

  std::string reset(const std::string &key,
                    const std::optional<std::string> &value) override {
    ++calls;
    maybe_time_out();
    if (value.has_value())
      current.apply(key, *value);
    return reset_answer.empty() ? current.get(key) : reset_answer;
  }
  void create_tag_index() override { current.tag_index = true; }
  void drop_tag_index() override { current.tag_index = false; }
  Settings settings() override { return current; }

  void close() override { closed = true; }

  // Number of upcoming single-key calls that throw Timeout.
  std::size_t timeouts{0};
  std::deque<ScriptedSweep> sweep_script;
  std::size_t calls{0};

  std::map<std::string, Entry> data;
  std::vector<TimePoint> expire_times;
  std::vector<std::string> evicted_tags;
  std::vector<std::string> warnings;
  HitStats hit_stats;
  std::uint64_t bytes{0};
  Settings current;
  std::string reset_answer;
  bool closed{false};

private:
  void maybe_time_out() {
    if (timeouts > 0) {
      --timeouts;
      throw Timeout();
    }
  }

  std::size_t next_sweep() {
    if (sweep_script.empty())
      return 0;
    const ScriptedSweep s = sweep_script.front();
    sweep_script.pop_front();
    if (s.result < 0)
      throw Timeout(s.partial);
    return static_cast<std::size_t>(s.result);
  }

  static Bytes drain(std::istream &in) {
    return Bytes(std::istreambuf_iterator<char>(in),
                 std::istreambuf_iterator<char>());
  }
};

// Shard factory producing FakeShards; `out` receives raw pointers to them in
// index order.
inline ShardFactory fake_factory(std::vector<FakeShard *> &out) {
  return [&out](std::size_t, const DiskShardConfig &) {
    auto shard = std::make_unique<FakeShard>();
    out.push_back(shard.get());
    return std::unique_ptr<IShard>(std::move(shard));
  };
}

} // namespace fanout_cache::testing
