#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fanout_cache {

// A shard could not get what it needed within its wait bound. Sweeps report
// how many items they had already removed when the wait ran out.
class Timeout : public std::runtime_error {
public:
  explicit Timeout(std::size_t count = 0)
      : std::runtime_error("shard wait bound exceeded"), count_(count) {}

  std::size_t count() const noexcept { return count_; }

private:
  std::size_t count_;
};

class NotFound : public std::out_of_range {
public:
  explicit NotFound(const std::string &key)
      : std::out_of_range("key not found: " + key), key_(key) {}

  const std::string &key() const noexcept { return key_; }

private:
  std::string key_;
};

} // namespace fanout_cache
