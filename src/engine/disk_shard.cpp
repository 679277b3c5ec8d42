#include "fanout_cache/disk_shard.hpp"

#include "fanout_cache/errors.hpp"
#include "fanout_cache/hash.hpp"
#include "fanout_cache/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fanout_cache {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::uint64_t key_hash;
  std::uint64_t seq;
  std::uint64_t value_size;
  std::int64_t expire_epoch_ms;
  std::uint32_t key_len;
  std::uint32_t tag_len;
  std::uint32_t value_len;
  std::uint8_t kind;
  std::uint8_t in_file;
  std::uint8_t has_tag;
  std::uint8_t reserved[5];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x46435231; // FCR1
constexpr std::uint64_t kCompactMinBytes = 64 * 1024;
constexpr auto kOrphanGrace = std::chrono::seconds(60);

std::uint32_t checksum32(const RecordHeader &h, const std::uint8_t *body,
                         std::size_t body_len) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (std::size_t i = 0; i < body_len; ++i)
    mix(body[i]);
  return sum;
}

// Epoch ms at which an item written at `now_ms` expires, -1 for never.
// TTLs reaching past the end of the clock saturate.
std::int64_t expire_at(std::int64_t now_ms,
                       std::optional<std::uint64_t> ttl_ms) {
  if (!ttl_ms.has_value())
    return -1;
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  if (*ttl_ms > static_cast<std::uint64_t>(kMax - now_ms))
    return kMax;
  return now_ms + static_cast<std::int64_t>(*ttl_ms);
}

[[noreturn]] void throw_errno(int err, const std::string &what) {
  throw std::system_error(err, std::generic_category(), what);
}

bool fsync_dir(const std::string &dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  ::close(dfd);
  return ok;
}

void untag(std::unordered_map<std::string, std::unordered_set<std::string>> &idx,
           const std::optional<std::string> &tag, const std::string &key) {
  if (!tag.has_value())
    return;
  auto it = idx.find(*tag);
  if (it == idx.end())
    return;
  it->second.erase(key);
  if (it->second.empty())
    idx.erase(it);
}

// Holds the shard's mutex and an exclusive flock on its lock file. Both are
// acquired within `timeout`, otherwise Timeout is thrown with nothing held.
class ShardLock {
public:
  ShardLock(std::timed_mutex &mutex, int fd, std::chrono::milliseconds timeout)
      : mutex_(mutex) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (!mutex_.try_lock_until(deadline))
      throw Timeout();
    if (fd < 0) {
      mutex_.unlock();
      throw std::logic_error("shard is closed");
    }
    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const int err = errno;
      if (err == EINTR)
        continue;
      if (err != EWOULDBLOCK) {
        mutex_.unlock();
        throw_errno(err, "flock");
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        mutex_.unlock();
        throw Timeout();
      }
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    fd_ = fd;
  }

  ~ShardLock() {
    ::flock(fd_, LOCK_UN);
    mutex_.unlock();
  }

  ShardLock(const ShardLock &) = delete;
  ShardLock &operator=(const ShardLock &) = delete;

private:
  std::timed_mutex &mutex_;
  int fd_{-1};
};

} // namespace

DiskShard::DiskShard(DiskShardConfig cfg) : cfg_(std::move(cfg)) {
  Settings probe;
  for (const auto &[k, v] : cfg_.settings)
    probe.apply(k, v);
  try {
    open();
  } catch (...) {
    close();
    throw;
  }
}

DiskShard::~DiskShard() { close(); }

void DiskShard::open() {
  std::filesystem::create_directories(values_dir());
  const std::string lock_path = cfg_.dir + "/lock";
  lock_fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (lock_fd_ < 0)
    throw_errno(errno, "open " + lock_path);

  std::size_t attempts = 0;
  while (true) {
    try {
      ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
      load_settings_file();
      if (!cfg_.settings.empty() || settings_ino_ == 0) {
        Settings s = settings_;
        for (const auto &[k, v] : cfg_.settings)
          s.apply(k, v);
        write_settings_file(s);
        settings_ = s;
        large_value_threshold_ = s.large_value_threshold;
      }
      Manifest m;
      if (!load_manifest(&m)) {
        m.generation = 1;
        m.active = 1;
        m.segments = {1};
        write_manifest(m);
      }
      rebuild(m);
      break;
    } catch (const Timeout &) {
      if (++attempts % 100 == 0)
        FANOUT_CACHE_LOG_WARN("still waiting to open shard {} ({} attempts)",
                              cfg_.dir, attempts);
    }
  }
  FANOUT_CACHE_LOG_DEBUG("opened shard {}: {} keys, generation {}", cfg_.dir,
                         index_.size(), generation_);
}

void DiskShard::close() {
  std::lock_guard<std::timed_mutex> guard(mutex_);
  if (active_fd_ >= 0) {
    ::close(active_fd_);
    active_fd_ = -1;
  }
  if (lock_fd_ >= 0) {
    ::close(lock_fd_);
    lock_fd_ = -1;
    FANOUT_CACHE_LOG_DEBUG("closed shard {}", cfg_.dir);
  }
  index_.clear();
  tag_index_.clear();
}

bool DiskShard::set(const std::string &key, const Bytes &value,
                    std::optional<std::uint64_t> ttl_ms,
                    const std::optional<std::string> &tag) {
  return store(key, prepare(key, value), ttl_ms, tag, false);
}

bool DiskShard::set(const std::string &key, std::istream &value,
                    std::optional<std::uint64_t> ttl_ms,
                    const std::optional<std::string> &tag) {
  return store(key, prepare(key, value), ttl_ms, tag, false);
}

bool DiskShard::add(const std::string &key, const Bytes &value,
                    std::optional<std::uint64_t> ttl_ms,
                    const std::optional<std::string> &tag) {
  return store(key, prepare(key, value), ttl_ms, tag, true);
}

bool DiskShard::add(const std::string &key, std::istream &value,
                    std::optional<std::uint64_t> ttl_ms,
                    const std::optional<std::string> &tag) {
  return store(key, prepare(key, value), ttl_ms, tag, true);
}

std::optional<Item> DiskShard::get(const std::string &key,
                                   const GetOptions &opts) {
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  auto miss = [&]() -> std::optional<Item> {
    if (settings_.statistics)
      ++counters_.misses;
    return std::nullopt;
  };

  auto it = index_.find(key);
  if (it == index_.end() || !is_live(it->second, to_epoch_ms(Clock::now())))
    return miss();
  const IndexEntry &e = it->second;

  Item item;
  if (e.in_file) {
    const auto path = value_path(e.file);
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) {
      FANOUT_CACHE_LOG_WARN("value file {} for key {} is missing", path, key);
      return miss();
    }
    if (opts.read)
      item.stream = std::move(in);
    else
      item.value.assign(std::istreambuf_iterator<char>(*in),
                        std::istreambuf_iterator<char>());
  } else {
    Bytes v;
    if (!read_inline(e, &v)) {
      FANOUT_CACHE_LOG_WARN("failed to read value of {} from {}", key,
                            seg_path(e.segment_id));
      return miss();
    }
    if (opts.read)
      item.stream = std::make_unique<std::istringstream>(
          std::string(v.begin(), v.end()), std::ios::in | std::ios::binary);
    else
      item.value = std::move(v);
  }
  if (opts.expire_time && e.expire_epoch_ms >= 0)
    item.expire_time = from_epoch_ms(e.expire_epoch_ms);
  if (opts.tag)
    item.tag = e.tag;
  if (settings_.statistics)
    ++counters_.hits;
  return item;
}

void DiskShard::del(const std::string &key) {
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  auto it = index_.find(key);
  if (it == index_.end() || !is_live(it->second, to_epoch_ms(Clock::now())))
    throw NotFound(key);
  remove_entry(key);
  maybe_compact();
}

bool DiskShard::contains(const std::string &key) {
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  auto it = index_.find(key);
  return it != index_.end() && is_live(it->second, to_epoch_ms(Clock::now()));
}

template <typename Match>
std::size_t DiskShard::sweep(Match match, const std::string *tag) {
  std::size_t removed = 0;
  while (true) {
    std::optional<ShardLock> lock;
    try {
      lock.emplace(mutex_, lock_fd_, cfg_.timeout);
    } catch (const Timeout &) {
      throw Timeout(removed);
    }
    refresh();

    const std::size_t batch = settings_.sweep_batch;
    std::vector<std::string> victims;
    victims.reserve(batch);
    if (tag != nullptr && settings_.tag_index) {
      auto t = tag_index_.find(*tag);
      if (t != tag_index_.end()) {
        for (const auto &k : t->second) {
          if (victims.size() >= batch)
            break;
          auto it = index_.find(k);
          if (it != index_.end() && match(it->second))
            victims.push_back(k);
        }
      }
    } else {
      for (const auto &[k, e] : index_) {
        if (victims.size() >= batch)
          break;
        if (match(e))
          victims.push_back(k);
      }
    }

    for (const auto &k : victims)
      remove_entry(k);
    removed += victims.size();
    if (!victims.empty())
      maybe_compact();
    if (victims.size() < batch)
      break;
  }
  return removed;
}

std::size_t DiskShard::expire(TimePoint now) {
  const auto now_ms = to_epoch_ms(now);
  return sweep(
      [now_ms](const IndexEntry &e) {
        return e.expire_epoch_ms >= 0 && e.expire_epoch_ms <= now_ms;
      },
      nullptr);
}

std::size_t DiskShard::evict(const std::string &tag) {
  return sweep(
      [&tag](const IndexEntry &e) { return e.tag.has_value() && *e.tag == tag; },
      &tag);
}

std::size_t DiskShard::clear() {
  return sweep([](const IndexEntry &) { return true; }, nullptr);
}

std::vector<std::string> DiskShard::check(bool fix) {
  namespace fs = std::filesystem;
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();

  std::vector<std::string> warnings;
  for (auto id : segments_) {
    if (!fs::exists(seg_path(id)))
      warnings.push_back(fmt::format("segment missing: {}", seg_path(id)));
  }

  std::vector<std::string> broken;
  std::unordered_set<std::string> referenced;
  for (const auto &[k, e] : index_) {
    if (!verify_record(e)) {
      warnings.push_back(fmt::format("record checksum mismatch: key {} in {}",
                                     k, seg_path(e.segment_id)));
      broken.push_back(k);
      continue;
    }
    if (!e.in_file)
      continue;
    referenced.insert(e.file);
    std::error_code ec;
    const auto sz = fs::file_size(value_path(e.file), ec);
    if (ec) {
      warnings.push_back(
          fmt::format("value file missing: {} (key {})", value_path(e.file), k));
      broken.push_back(k);
    } else if (sz != e.value_size) {
      warnings.push_back(fmt::format(
          "value file size mismatch: {} has {} bytes, expected {}",
          value_path(e.file), sz, e.value_size));
      broken.push_back(k);
    }
  }

  // Writers create value files before taking the lock, so young files may
  // belong to a commit still in flight.
  const auto cutoff = fs::file_time_type::clock::now() - kOrphanGrace;
  std::vector<fs::path> orphans;
  std::error_code ec;
  for (auto it = fs::directory_iterator(values_dir(), ec);
       !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (referenced.contains(name))
      continue;
    std::error_code tec;
    const auto mtime = fs::last_write_time(it->path(), tec);
    if (tec || mtime > cutoff)
      continue;
    warnings.push_back(fmt::format("unreferenced value file: {}",
                                   it->path().string()));
    orphans.push_back(it->path());
  }
  for (auto it = fs::directory_iterator(cfg_.dir, ec);
       !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.rfind("segment_", 0) != 0 || name.size() < 13 ||
        name.substr(name.size() - 4) != ".log")
      continue;
    std::uint32_t id = 0;
    try {
      id = static_cast<std::uint32_t>(
          std::stoul(name.substr(8, name.size() - 12)));
    } catch (const std::exception &) {
      continue;
    }
    if (std::find(segments_.begin(), segments_.end(), id) != segments_.end())
      continue;
    warnings.push_back(
        fmt::format("unreferenced segment file: {}", it->path().string()));
    orphans.push_back(it->path());
  }

  if (fix && !warnings.empty()) {
    for (const auto &k : broken) {
      if (index_.contains(k))
        remove_entry(k);
    }
    for (const auto &p : orphans) {
      std::error_code rec;
      fs::remove(p, rec);
      if (rec)
        FANOUT_CACHE_LOG_ERROR("failed to remove {}: {}", p.string(),
                               rec.message());
    }
    FANOUT_CACHE_LOG_WARN("repaired shard {}: {} broken records, {} orphans",
                          cfg_.dir, broken.size(), orphans.size());
    maybe_compact();
  }
  return warnings;
}

HitStats DiskShard::stats(bool enable, bool reset) {
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  HitStats out = counters_;
  if (reset)
    counters_ = {};
  if (settings_.statistics != enable) {
    Settings s = settings_;
    s.statistics = enable;
    write_settings_file(s);
    settings_ = s;
  }
  return out;
}

std::uint64_t DiskShard::volume() {
  namespace fs = std::filesystem;
  std::uint64_t total = 0;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(cfg_.dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code sec;
    if (!it->is_regular_file(sec) || sec)
      continue;
    const auto sz = it->file_size(sec);
    if (!sec)
      total += sz;
  }
  return total;
}

std::size_t DiskShard::size() {
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  return index_.size();
}

std::string DiskShard::reset(const std::string &key,
                             const std::optional<std::string> &value) {
  if (!Settings::is_known(key))
    throw std::invalid_argument("unknown setting: " + key);
  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();
  if (value.has_value()) {
    Settings s = settings_;
    s.apply(key, *value);
    write_settings_file(s);
    const bool index_changed = s.tag_index != settings_.tag_index;
    settings_ = s;
    large_value_threshold_ = s.large_value_threshold;
    if (index_changed)
      rebuild_tag_index();
  }
  return settings_.get(key);
}

void DiskShard::create_tag_index() { reset("tag_index", "1"); }

void DiskShard::drop_tag_index() { reset("tag_index", "0"); }

Settings DiskShard::settings() {
  std::lock_guard<std::timed_mutex> guard(mutex_);
  return settings_;
}

void DiskShard::refresh() {
  Manifest m;
  if (!load_manifest(&m)) {
    FANOUT_CACHE_LOG_WARN("manifest of {} disappeared, rewriting", cfg_.dir);
    m.generation = generation_ + 1;
    m.active = active_segment_;
    m.segments = {active_segment_};
    write_manifest(m);
  }
  if (m.generation != generation_ || m.active != active_segment_) {
    rebuild(m);
  } else {
    const auto end = scan_segment(active_segment_, applied_offset_);
    total_segment_bytes_ += end - applied_offset_;
    applied_offset_ = end;
  }
  load_settings_file();
}

void DiskShard::rebuild(const Manifest &m) {
  index_.clear();
  tag_index_.clear();
  live_bytes_ = 0;
  total_segment_bytes_ = 0;
  segments_ = m.segments;
  if (std::find(segments_.begin(), segments_.end(), m.active) ==
      segments_.end())
    segments_.push_back(m.active);
  for (auto id : segments_) {
    const auto end = scan_segment(id, 0);
    total_segment_bytes_ += end;
    if (id == m.active)
      applied_offset_ = end;
  }
  generation_ = m.generation;
  active_segment_ = m.active;

  if (active_fd_ >= 0)
    ::close(active_fd_);
  const auto path = seg_path(active_segment_);
  active_fd_ =
      ::open(path.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, 0644);
  if (active_fd_ < 0)
    throw_errno(errno, "open " + path);
}

std::uint64_t DiskShard::scan_segment(std::uint32_t id, std::uint64_t from) {
  const std::string path = seg_path(id);
  int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0)
    throw_errno(errno, "open " + path);
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    throw_errno(err, "stat " + path);
  }
  const auto file_size = static_cast<std::uint64_t>(st.st_size);

  std::uint64_t off = from;
  std::vector<std::uint8_t> body;
  bool torn = false;
  while (off < file_size) {
    RecordHeader h{};
    if (off + sizeof(h) > file_size ||
        ::pread(fd, &h, sizeof(h), static_cast<off_t>(off)) !=
            static_cast<ssize_t>(sizeof(h)) ||
        h.magic != kMagic) {
      torn = true;
      break;
    }
    const std::uint64_t body_len =
        static_cast<std::uint64_t>(h.key_len) + h.tag_len + h.value_len;
    if (off + sizeof(h) + body_len > file_size) {
      torn = true;
      break;
    }
    body.resize(body_len);
    if (body_len > 0 &&
        ::pread(fd, body.data(), body_len,
                static_cast<off_t>(off + sizeof(h))) !=
            static_cast<ssize_t>(body_len)) {
      torn = true;
      break;
    }
    if (checksum32(h, body.data(), body.size()) != h.checksum) {
      torn = true;
      break;
    }

    const char *b = reinterpret_cast<const char *>(body.data());
    std::string key(b, h.key_len);
    next_seq_ = std::max(next_seq_, h.seq + 1);
    if (h.kind == static_cast<std::uint8_t>(RecordKind::Delete)) {
      apply_delete(key);
    } else {
      IndexEntry e;
      e.segment_id = id;
      e.offset = off;
      e.record_len = static_cast<std::uint32_t>(sizeof(h) + body_len);
      e.seq = h.seq;
      e.value_size = h.value_size;
      e.expire_epoch_ms = h.expire_epoch_ms;
      e.in_file = h.in_file != 0;
      if (h.has_tag)
        e.tag = std::string(b + h.key_len, h.tag_len);
      if (e.in_file)
        e.file.assign(b + h.key_len + h.tag_len, h.value_len);
      apply_put(key, std::move(e));
    }
    off += sizeof(h) + body_len;
  }

  if (torn) {
    FANOUT_CACHE_LOG_WARN("truncating torn tail of {} at offset {} ({} bytes)",
                          path, off, file_size - off);
    if (::ftruncate(fd, static_cast<off_t>(off)) != 0) {
      const int err = errno;
      ::close(fd);
      throw_errno(err, "truncate " + path);
    }
  }
  ::close(fd);
  return off;
}

void DiskShard::apply_put(const std::string &key, IndexEntry e) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    live_bytes_ -= it->second.record_len;
    if (settings_.tag_index)
      untag(tag_index_, it->second.tag, key);
  }
  live_bytes_ += e.record_len;
  if (settings_.tag_index && e.tag.has_value())
    tag_index_[*e.tag].insert(key);
  index_[key] = std::move(e);
}

void DiskShard::apply_delete(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  live_bytes_ -= it->second.record_len;
  if (settings_.tag_index)
    untag(tag_index_, it->second.tag, key);
  index_.erase(it);
}

DiskShard::PreparedValue DiskShard::prepare(const std::string &key,
                                            const Bytes &value) {
  PreparedValue out;
  out.size = value.size();
  if (value.size() >= large_value_threshold_.load()) {
    std::uint64_t written = 0;
    out.file =
        write_value_file(key, value.data(), value.size(), nullptr, &written);
    out.in_file = true;
  } else {
    out.bytes = value;
  }
  return out;
}

DiskShard::PreparedValue DiskShard::prepare(const std::string &key,
                                            std::istream &value) {
  PreparedValue out;
  out.file = write_value_file(key, nullptr, 0, &value, &out.size);
  out.in_file = true;
  return out;
}

std::string DiskShard::write_value_file(const std::string &key,
                                        const std::uint8_t *data,
                                        std::size_t len, std::istream *in,
                                        std::uint64_t *written) {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  const auto name = fmt::format("{:016x}-{:016x}.val", fnv1a64(key), rng());
  const auto final_path = value_path(name);
  const auto tmp = final_path + ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    throw_errno(errno, "open " + tmp);
  auto fail = [&](int err) {
    ::close(fd);
    ::unlink(tmp.c_str());
    throw_errno(err, "write " + tmp);
  };

  std::uint64_t total = 0;
  auto write_all = [&](const std::uint8_t *p, std::size_t n) {
    while (n > 0) {
      const ssize_t w = ::write(fd, p, n);
      if (w < 0) {
        if (errno == EINTR)
          continue;
        fail(errno);
      }
      p += w;
      n -= static_cast<std::size_t>(w);
      total += static_cast<std::uint64_t>(w);
    }
  };

  if (in != nullptr) {
    char buf[64 * 1024];
    while (in->read(buf, sizeof(buf)) || in->gcount() > 0)
      write_all(reinterpret_cast<const std::uint8_t *>(buf),
                static_cast<std::size_t>(in->gcount()));
    if (in->bad())
      fail(EIO);
  } else {
    write_all(data, len);
  }

  if (::close(fd) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    throw_errno(err, "close " + tmp);
  }
  if (::rename(tmp.c_str(), final_path.c_str()) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    throw_errno(err, "rename " + tmp);
  }
  *written = total;
  return name;
}

bool DiskShard::store(const std::string &key, PreparedValue value,
                      std::optional<std::uint64_t> ttl_ms,
                      const std::optional<std::string> &tag,
                      bool only_if_absent) {
  // Drops the prepared value file unless a record ends up referencing it.
  struct FileGuard {
    std::string path;
    ~FileGuard() {
      if (path.empty())
        return;
      std::error_code ec;
      std::filesystem::remove(path, ec);
    }
  } guard{value.in_file ? value_path(value.file) : std::string()};

  ShardLock lock(mutex_, lock_fd_, cfg_.timeout);
  refresh();

  const auto now_ms = to_epoch_ms(Clock::now());
  std::optional<IndexEntry> old;
  auto it = index_.find(key);
  if (it != index_.end()) {
    if (only_if_absent && is_live(it->second, now_ms))
      return false;
    old = it->second;
  }

  const std::int64_t expire_ms = expire_at(now_ms, ttl_ms);
  IndexEntry e;
  if (value.in_file)
    e = append_record(key, tag,
                      reinterpret_cast<const std::uint8_t *>(value.file.data()),
                      value.file.size(), value.size, expire_ms,
                      RecordKind::Put, true);
  else
    e = append_record(key, tag, value.bytes.data(), value.bytes.size(),
                      value.size, expire_ms, RecordKind::Put, false);
  guard.path.clear();
  apply_put(key, std::move(e));

  if (old.has_value()) {
    if (old->in_file) {
      std::error_code ec;
      std::filesystem::remove(value_path(old->file), ec);
    }
    maybe_compact();
  }
  return true;
}

DiskShard::IndexEntry
DiskShard::append_record(const std::string &key,
                         const std::optional<std::string> &tag,
                         const std::uint8_t *payload, std::size_t len,
                         std::uint64_t value_size, std::int64_t expire_epoch_ms,
                         RecordKind kind, bool in_file) {
  RecordHeader h{};
  h.magic = kMagic;
  h.key_hash = fnv1a64(key);
  h.seq = next_seq_;
  h.value_size = value_size;
  h.expire_epoch_ms = expire_epoch_ms;
  h.key_len = static_cast<std::uint32_t>(key.size());
  h.tag_len = tag.has_value() ? static_cast<std::uint32_t>(tag->size()) : 0;
  h.value_len = static_cast<std::uint32_t>(len);
  h.kind = static_cast<std::uint8_t>(kind);
  h.in_file = in_file ? 1 : 0;
  h.has_tag = tag.has_value() ? 1 : 0;

  std::vector<std::uint8_t> buf(sizeof(h) + h.key_len + h.tag_len + len);
  std::uint8_t *body = buf.data() + sizeof(h);
  std::memcpy(body, key.data(), key.size());
  if (tag.has_value())
    std::memcpy(body + h.key_len, tag->data(), tag->size());
  if (len > 0)
    std::memcpy(body + h.key_len + h.tag_len, payload, len);
  h.checksum = checksum32(h, body, buf.size() - sizeof(h));
  std::memcpy(buf.data(), &h, sizeof(h));

  const off_t off = ::lseek(active_fd_, 0, SEEK_END);
  if (off < 0)
    throw_errno(errno, "seek " + seg_path(active_segment_));
  const ssize_t w = ::write(active_fd_, buf.data(), buf.size());
  if (w != static_cast<ssize_t>(buf.size())) {
    const int err = w < 0 ? errno : EIO;
    if (w > 0 && ::ftruncate(active_fd_, off) != 0)
      FANOUT_CACHE_LOG_ERROR("failed to drop partial record in {}",
                             seg_path(active_segment_));
    throw_errno(err, "append " + seg_path(active_segment_));
  }
  if (!sync_for_policy()) {
    // Take the record back so a failed call leaves nothing behind. If that
    // fails too the record is on disk and counts as written.
    const int err = errno;
    if (::ftruncate(active_fd_, off) == 0)
      throw_errno(err, "fsync " + seg_path(active_segment_));
    FANOUT_CACHE_LOG_ERROR("fsync of {} failed ({}) and the record stays",
                           seg_path(active_segment_), std::strerror(err));
  }

  ++next_seq_;
  applied_offset_ = static_cast<std::uint64_t>(off) + buf.size();
  total_segment_bytes_ += buf.size();

  IndexEntry e;
  e.segment_id = active_segment_;
  e.offset = static_cast<std::uint64_t>(off);
  e.record_len = static_cast<std::uint32_t>(buf.size());
  e.seq = h.seq;
  e.value_size = value_size;
  e.expire_epoch_ms = expire_epoch_ms;
  e.in_file = in_file;
  if (in_file)
    e.file.assign(reinterpret_cast<const char *>(payload), len);
  e.tag = tag;
  return e;
}

void DiskShard::remove_entry(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  const IndexEntry old = it->second;
  append_record(key, std::nullopt, nullptr, 0, 0, -1, RecordKind::Delete,
                false);
  apply_delete(key);
  if (old.in_file) {
    std::error_code ec;
    std::filesystem::remove(value_path(old.file), ec);
    if (ec)
      FANOUT_CACHE_LOG_WARN("failed to remove value file {}: {}",
                            value_path(old.file), ec.message());
  }
}

bool DiskShard::read_inline(const IndexEntry &e, Bytes *out) const {
  const std::string path = seg_path(e.segment_id);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return false;
  RecordHeader h{};
  if (::pread(fd, &h, sizeof(h), static_cast<off_t>(e.offset)) !=
      static_cast<ssize_t>(sizeof(h))) {
    ::close(fd);
    return false;
  }
  out->assign(h.value_len, 0);
  if (h.value_len > 0 &&
      ::pread(fd, out->data(), h.value_len,
              static_cast<off_t>(e.offset + sizeof(h) + h.key_len +
                                 h.tag_len)) !=
          static_cast<ssize_t>(h.value_len)) {
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

bool DiskShard::verify_record(const IndexEntry &e) const {
  const std::string path = seg_path(e.segment_id);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return false;
  std::vector<std::uint8_t> buf(e.record_len);
  const bool read_ok =
      e.record_len >= sizeof(RecordHeader) &&
      ::pread(fd, buf.data(), buf.size(), static_cast<off_t>(e.offset)) ==
          static_cast<ssize_t>(buf.size());
  ::close(fd);
  if (!read_ok)
    return false;
  RecordHeader h{};
  std::memcpy(&h, buf.data(), sizeof(h));
  return h.magic == kMagic &&
         checksum32(h, buf.data() + sizeof(h), buf.size() - sizeof(h)) ==
             h.checksum;
}

bool DiskShard::is_live(const IndexEntry &e, std::int64_t now_ms) const {
  return e.expire_epoch_ms < 0 || e.expire_epoch_ms > now_ms;
}

void DiskShard::maybe_compact() {
  if (total_segment_bytes_ < kCompactMinBytes)
    return;
  const double fragmentation =
      1.0 - static_cast<double>(live_bytes_) /
                static_cast<double>(total_segment_bytes_);
  if (fragmentation < settings_.compaction_threshold)
    return;

  const auto start = std::chrono::steady_clock::now();
  const std::uint32_t new_id =
      *std::max_element(segments_.begin(), segments_.end()) + 1;
  const std::string path = seg_path(new_id);
  int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    FANOUT_CACHE_LOG_WARN("compaction of {} skipped: cannot create {}",
                          cfg_.dir, path);
    return;
  }

  std::unordered_map<std::uint32_t, int> readers;
  std::vector<std::pair<IndexEntry *, std::uint64_t>> moved;
  moved.reserve(index_.size());
  std::vector<std::uint8_t> buf;
  std::uint64_t off = 0;
  bool ok = true;
  for (auto &[k, e] : index_) {
    auto r = readers.find(e.segment_id);
    if (r == readers.end()) {
      const auto src = seg_path(e.segment_id);
      r = readers.emplace(e.segment_id,
                          ::open(src.c_str(), O_RDONLY | O_CLOEXEC))
              .first;
    }
    buf.resize(e.record_len);
    if (r->second < 0 ||
        ::pread(r->second, buf.data(), buf.size(),
                static_cast<off_t>(e.offset)) !=
            static_cast<ssize_t>(buf.size()) ||
        ::write(fd, buf.data(), buf.size()) !=
            static_cast<ssize_t>(buf.size())) {
      ok = false;
      break;
    }
    moved.emplace_back(&e, off);
    off += e.record_len;
  }
  for (auto &[id, rfd] : readers)
    if (rfd >= 0)
      ::close(rfd);
  if (ok && ::fsync(fd) != 0)
    ok = false;
  ::close(fd);
  if (!ok) {
    ::unlink(path.c_str());
    FANOUT_CACHE_LOG_WARN("compaction of {} aborted", cfg_.dir);
    return;
  }

  Manifest m;
  m.generation = generation_ + 1;
  m.active = new_id;
  m.segments = {new_id};
  write_manifest(m);

  for (auto id : segments_)
    ::unlink(seg_path(id).c_str());
  for (auto &[e, o] : moved) {
    e->segment_id = new_id;
    e->offset = o;
  }
  const auto reclaimed = total_segment_bytes_ - off;
  segments_ = {new_id};
  active_segment_ = new_id;
  generation_ = m.generation;
  applied_offset_ = off;
  total_segment_bytes_ = off;
  live_bytes_ = off;

  ::close(active_fd_);
  active_fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC,
                      0644);
  if (active_fd_ < 0)
    throw_errno(errno, "open " + path);

  FANOUT_CACHE_LOG_INFO(
      "compacted {} into segment {}: reclaimed {} bytes in {} ms", cfg_.dir,
      new_id, reclaimed,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
}

bool DiskShard::sync_for_policy() {
  if (settings_.fsync == FsyncMode::Never)
    return true;
  if (settings_.fsync == FsyncMode::Always)
    return cfg_.sync_fd(active_fd_) == 0;
  const auto now_s = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (now_s != last_fsync_epoch_s_) {
    last_fsync_epoch_s_ = now_s;
    return cfg_.sync_fd(active_fd_) == 0;
  }
  return true;
}

bool DiskShard::load_manifest(Manifest *m) const {
  std::ifstream in(cfg_.dir + "/manifest.txt");
  if (!in.is_open())
    return false;
  m->segments.clear();
  std::string line;
  try {
    while (std::getline(in, line)) {
      if (line.rfind("generation=", 0) == 0)
        m->generation = std::stoull(line.substr(11));
      else if (line.rfind("active=", 0) == 0)
        m->active = static_cast<std::uint32_t>(std::stoul(line.substr(7)));
      else if (line.rfind("segment=", 0) == 0)
        m->segments.push_back(
            static_cast<std::uint32_t>(std::stoul(line.substr(8))));
    }
  } catch (const std::exception &) {
    FANOUT_CACHE_LOG_ERROR("malformed manifest in {}: {}", cfg_.dir, line);
    return false;
  }
  if (m->segments.empty())
    m->segments.push_back(m->active);
  return true;
}

void DiskShard::write_manifest(const Manifest &m) {
  const std::string tmp = cfg_.dir + "/manifest.tmp";
  const std::string final = cfg_.dir + "/manifest.txt";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
      throw_errno(errno, "open " + tmp);
    out << "generation=" << m.generation << "\n";
    out << "active=" << m.active << "\n";
    for (auto id : m.segments)
      out << "segment=" << id << "\n";
    out.flush();
    if (!out)
      throw_errno(EIO, "write " + tmp);
  }
  int fd = ::open(tmp.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    throw_errno(errno, "open " + tmp);
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  if (!ok)
    throw_errno(errno, "fsync " + tmp);
  if (::rename(tmp.c_str(), final.c_str()) != 0)
    throw_errno(errno, "rename " + tmp);
  if (!fsync_dir(cfg_.dir))
    FANOUT_CACHE_LOG_WARN("fsync of directory {} failed", cfg_.dir);
}

void DiskShard::load_settings_file() {
  const std::string path = cfg_.dir + "/settings.txt";
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    settings_ino_ = 0;
    return;
  }
  const auto mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) *
                            1000000000LL +
                        st.st_mtim.tv_nsec;
  if (static_cast<std::uint64_t>(st.st_ino) == settings_ino_ &&
      mtime_ns == settings_mtime_ns_)
    return;

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  Settings s;
  std::string err;
  if (!parse_settings(ss.str(), s, &err)) {
    FANOUT_CACHE_LOG_ERROR("ignoring settings of {}: {}", cfg_.dir, err);
    return;
  }
  const bool index_changed = s.tag_index != settings_.tag_index;
  settings_ = s;
  large_value_threshold_ = s.large_value_threshold;
  settings_ino_ = static_cast<std::uint64_t>(st.st_ino);
  settings_mtime_ns_ = mtime_ns;
  if (index_changed)
    rebuild_tag_index();
}

void DiskShard::write_settings_file(const Settings &s) {
  const std::string tmp = cfg_.dir + "/settings.tmp";
  const std::string final = cfg_.dir + "/settings.txt";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
      throw_errno(errno, "open " + tmp);
    out << serialize_settings(s);
    out.flush();
    if (!out)
      throw_errno(EIO, "write " + tmp);
  }
  if (::rename(tmp.c_str(), final.c_str()) != 0)
    throw_errno(errno, "rename " + tmp);
  struct stat st {};
  if (::stat(final.c_str(), &st) == 0) {
    settings_ino_ = static_cast<std::uint64_t>(st.st_ino);
    settings_mtime_ns_ = static_cast<std::int64_t>(st.st_mtim.tv_sec) *
                             1000000000LL +
                         st.st_mtim.tv_nsec;
  }
}

void DiskShard::rebuild_tag_index() {
  tag_index_.clear();
  if (!settings_.tag_index)
    return;
  for (const auto &[k, e] : index_)
    if (e.tag.has_value())
      tag_index_[*e.tag].insert(k);
}

std::string DiskShard::seg_path(std::uint32_t id) const {
  return cfg_.dir + "/segment_" + std::to_string(id) + ".log";
}

std::string DiskShard::values_dir() const { return cfg_.dir + "/values"; }

std::string DiskShard::value_path(const std::string &file) const {
  return values_dir() + "/" + file;
}

} // namespace fanout_cache
