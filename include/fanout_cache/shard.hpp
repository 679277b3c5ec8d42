#pragma once

#include "fanout_cache/settings.hpp"
#include "fanout_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace fanout_cache {

// One independently lockable partition of the keyspace. Every call may throw
// Timeout when the shard cannot get its lock within the wait bound; sweeps
// attach the number of items they already removed.
class IShard {
public:
  virtual ~IShard() = default;

  virtual bool set(const std::string &key, const Bytes &value,
                   std::optional<std::uint64_t> ttl_ms,
                   const std::optional<std::string> &tag) = 0;
  virtual bool set(const std::string &key, std::istream &value,
                   std::optional<std::uint64_t> ttl_ms,
                   const std::optional<std::string> &tag) = 0;
  virtual bool add(const std::string &key, const Bytes &value,
                   std::optional<std::uint64_t> ttl_ms,
                   const std::optional<std::string> &tag) = 0;
  virtual bool add(const std::string &key, std::istream &value,
                   std::optional<std::uint64_t> ttl_ms,
                   const std::optional<std::string> &tag) = 0;
  virtual std::optional<Item> get(const std::string &key,
                                  const GetOptions &opts) = 0;
  // Throws NotFound when the key is absent.
  virtual void del(const std::string &key) = 0;
  virtual bool contains(const std::string &key) = 0;

  virtual std::size_t expire(TimePoint now) = 0;
  virtual std::size_t evict(const std::string &tag) = 0;
  virtual std::size_t clear() = 0;

  virtual std::vector<std::string> check(bool fix) = 0;
  virtual HitStats stats(bool enable, bool reset) = 0;
  virtual std::uint64_t volume() = 0;
  virtual std::size_t size() = 0;

  virtual std::string reset(const std::string &key,
                            const std::optional<std::string> &value) = 0;
  virtual void create_tag_index() = 0;
  virtual void drop_tag_index() = 0;
  virtual Settings settings() = 0;

  virtual void close() = 0;
};

} // namespace fanout_cache
