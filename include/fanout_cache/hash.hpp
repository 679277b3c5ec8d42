#pragma once

#include <cstdint>
#include <string_view>

namespace fanout_cache {

// 64-bit FNV-1a. Unseeded, so the result is the same in every process.
inline std::uint64_t fnv1a64(std::string_view s) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace fanout_cache
