#include "fanout_cache/errors.hpp"
#include "fanout_cache/fanout_cache.hpp"
#include "fanout_cache/log.hpp"
#include "fanout_cache/settings.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

int usage() {
  std::cerr << "usage: fanout_cache_cli [--shards N] [--timeout-ms T] "
               "[--settings file.json] [--log-level L] <dir> <command> "
               "[args]\n"
               "commands:\n"
               "  set <key> <value> [ttl_ms] [tag]\n"
               "  add <key> <value> [ttl_ms] [tag]\n"
               "  get <key>\n"
               "  read <key>\n"
               "  del <key>\n"
               "  contains <key>\n"
               "  expire | evict <tag> | clear\n"
               "  check [fix]\n"
               "  stats | volume | len | settings\n"
               "  reset <setting> [value]\n";
  return 1;
}

fanout_cache::Bytes to_bytes(const std::string &s) {
  return fanout_cache::Bytes(s.begin(), s.end());
}

} // namespace

int main(int argc, char **argv) {
  using namespace fanout_cache;

  CacheOptions opts;
  opts.backoff = exponential_backoff(std::chrono::microseconds(50),
                                     std::chrono::milliseconds(5));
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    std::uint64_t n = 0;
    if (a == "--shards" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n) || n == 0)
        return usage();
      opts.shards = static_cast<std::size_t>(n);
    } else if (a == "--timeout-ms" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n))
        return usage();
      opts.timeout = std::chrono::milliseconds(n);
    } else if (a == "--settings" && i + 1 < argc) {
      std::string err;
      if (!load_settings_json(argv[++i], opts.settings, &err)) {
        std::cerr << "settings: " << err << "\n";
        return 2;
      }
    } else if (a == "--log-level" && i + 1 < argc) {
      LogLevel level;
      if (!parse_log_level(argv[++i], level))
        return usage();
      set_log_level(level);
    } else {
      args.push_back(a);
    }
  }
  if (args.size() < 2)
    return usage();

  const std::string cmd = lower(args[1]);
  auto need = [&](std::size_t n) { return args.size() >= n; };

  try {
    FanoutCache cache(args[0], opts);

    if (cmd == "set" || cmd == "add") {
      if (!need(4))
        return usage();
      SetOptions so;
      so.retry = true;
      std::uint64_t ttl = 0;
      if (args.size() > 4) {
        if (!parse_u64(args[4], ttl))
          return usage();
        so.ttl_ms = ttl;
      }
      if (args.size() > 5)
        so.tag = args[5];
      const bool ok = cmd == "set" ? cache.set(args[2], to_bytes(args[3]), so)
                                   : cache.add(args[2], to_bytes(args[3]), so);
      std::cout << (ok ? "OK" : "EXISTS") << "\n";
      return ok ? 0 : 1;
    }
    if (cmd == "get") {
      if (!need(3))
        return usage();
      GetOptions go;
      go.retry = true;
      go.expire_time = true;
      go.tag = true;
      auto item = cache.get(args[2], go);
      if (!item.has_value()) {
        std::cout << "(nil)\n";
        return 1;
      }
      std::cout.write(reinterpret_cast<const char *>(item->value.data()),
                      static_cast<std::streamsize>(item->value.size()));
      std::cout << "\n";
      if (item->expire_time.has_value())
        std::cout << "expire_epoch_ms:" << to_epoch_ms(*item->expire_time)
                  << "\n";
      if (item->tag.has_value())
        std::cout << "tag:" << *item->tag << "\n";
      return 0;
    }
    if (cmd == "read") {
      if (!need(3))
        return usage();
      try {
        auto in = cache.read(args[2]);
        std::cout << in->rdbuf() << "\n";
        return 0;
      } catch (const NotFound &e) {
        std::cerr << "not found: " << e.key() << "\n";
        return 1;
      }
    }
    if (cmd == "del") {
      if (!need(3))
        return usage();
      const bool ok = cache.del(args[2], true);
      std::cout << (ok ? 1 : 0) << "\n";
      return ok ? 0 : 1;
    }
    if (cmd == "contains") {
      if (!need(3))
        return usage();
      const bool found = cache.contains(args[2]);
      std::cout << (found ? 1 : 0) << "\n";
      return found ? 0 : 1;
    }
    if (cmd == "expire") {
      std::cout << cache.expire() << "\n";
      return 0;
    }
    if (cmd == "evict") {
      if (!need(3))
        return usage();
      std::cout << cache.evict(args[2]) << "\n";
      return 0;
    }
    if (cmd == "clear") {
      std::cout << cache.clear() << "\n";
      return 0;
    }
    if (cmd == "check") {
      const bool fix = args.size() > 2 && lower(args[2]) == "fix";
      const auto warnings = cache.check(fix);
      for (const auto &w : warnings)
        std::cout << w << "\n";
      std::cout << "warnings:" << warnings.size() << "\n";
      return 0;
    }
    if (cmd == "stats") {
      const auto s = cache.stats(cache.settings().statistics, false);
      std::cout << "hits:" << s.hits << "\nmisses:" << s.misses << "\n";
      return 0;
    }
    if (cmd == "settings") {
      for (const auto &[k, v] : cache.settings().to_map())
        std::cout << k << "=" << v << "\n";
      return 0;
    }
    if (cmd == "volume") {
      std::cout << cache.volume() << "\n";
      return 0;
    }
    if (cmd == "len") {
      std::cout << cache.size() << "\n";
      return 0;
    }
    if (cmd == "reset") {
      if (!need(3))
        return usage();
      std::optional<std::string> value;
      if (args.size() > 3)
        value = args[3];
      std::cout << cache.reset(args[2], value) << "\n";
      return 0;
    }
    return usage();
  } catch (const Timeout &e) {
    std::cerr << "timeout: " << e.what() << "\n";
  } catch (const std::invalid_argument &e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
  } catch (const std::system_error &e) {
    std::cerr << "I/O error: " << e.what() << "\n";
  }
  return 2;
}
