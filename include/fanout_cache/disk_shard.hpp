#pragma once

#include "fanout_cache/settings.hpp"
#include "fanout_cache/shard.hpp"
#include "fanout_cache/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <unistd.h>

namespace fanout_cache {

struct DiskShardConfig {
  std::string dir;
  std::chrono::milliseconds timeout{25};
  SettingsOverrides settings;
  // Flushes the active segment. Tests swap it to simulate a failing disk.
  int (*sync_fd)(int){::fsync};
};

// Shard backed by an append-only record log in its own directory. Several
// handles, in one process or many, may open the same directory: each call
// takes the shard lock (a mutex plus an flock on `lock`) and replays records
// other handles appended since it last looked.
class DiskShard final : public IShard {
public:
  // Creates the directory if needed. Throws std::system_error on I/O errors.
  explicit DiskShard(DiskShardConfig cfg);
  ~DiskShard() override;

  DiskShard(const DiskShard &) = delete;
  DiskShard &operator=(const DiskShard &) = delete;

  bool set(const std::string &key, const Bytes &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override;
  bool set(const std::string &key, std::istream &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override;
  bool add(const std::string &key, const Bytes &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override;
  bool add(const std::string &key, std::istream &value,
           std::optional<std::uint64_t> ttl_ms,
           const std::optional<std::string> &tag) override;
  std::optional<Item> get(const std::string &key,
                          const GetOptions &opts) override;
  void del(const std::string &key) override;
  bool contains(const std::string &key) override;

  std::size_t expire(TimePoint now) override;
  std::size_t evict(const std::string &tag) override;
  std::size_t clear() override;

  std::vector<std::string> check(bool fix) override;
  HitStats stats(bool enable, bool reset) override;
  std::uint64_t volume() override;
  std::size_t size() override;

  std::string reset(const std::string &key,
                    const std::optional<std::string> &value) override;
  void create_tag_index() override;
  void drop_tag_index() override;
  Settings settings() override;

  void close() override;

  const std::string &dir() const { return cfg_.dir; }

private:
  enum class RecordKind : std::uint8_t { Put = 0, Delete = 1 };

  struct IndexEntry {
    std::uint32_t segment_id{0};
    std::uint64_t offset{0};
    std::uint32_t record_len{0};
    std::uint64_t seq{0};
    std::uint64_t value_size{0};
    std::int64_t expire_epoch_ms{-1};
    bool in_file{false};
    std::string file;
    std::optional<std::string> tag;
  };

  struct Manifest {
    std::uint64_t generation{1};
    std::uint32_t active{1};
    std::vector<std::uint32_t> segments;
  };

  // A value ready to be recorded: inline bytes, or a file already written
  // under values/.
  struct PreparedValue {
    Bytes bytes;
    std::string file;
    std::uint64_t size{0};
    bool in_file{false};
  };

  void open();
  void refresh();
  void rebuild(const Manifest &m);
  std::uint64_t scan_segment(std::uint32_t id, std::uint64_t from);
  void apply_put(const std::string &key, IndexEntry e);
  void apply_delete(const std::string &key);

  PreparedValue prepare(const std::string &key, const Bytes &value);
  PreparedValue prepare(const std::string &key, std::istream &value);
  std::string write_value_file(const std::string &key,
                               const std::uint8_t *data, std::size_t len,
                               std::istream *in, std::uint64_t *written);
  bool store(const std::string &key, PreparedValue value,
             std::optional<std::uint64_t> ttl_ms,
             const std::optional<std::string> &tag, bool only_if_absent);

  IndexEntry append_record(const std::string &key,
                           const std::optional<std::string> &tag,
                           const std::uint8_t *payload, std::size_t len,
                           std::uint64_t value_size,
                           std::int64_t expire_epoch_ms, RecordKind kind,
                           bool in_file);
  void remove_entry(const std::string &key);
  bool read_inline(const IndexEntry &e, Bytes *out) const;
  bool verify_record(const IndexEntry &e) const;
  bool is_live(const IndexEntry &e, std::int64_t now_ms) const;

  template <typename Match> std::size_t sweep(Match match, const std::string *tag);

  void maybe_compact();
  bool sync_for_policy();

  bool load_manifest(Manifest *m) const;
  void write_manifest(const Manifest &m);
  void load_settings_file();
  void write_settings_file(const Settings &s);
  void rebuild_tag_index();

  std::string seg_path(std::uint32_t id) const;
  std::string values_dir() const;
  std::string value_path(const std::string &file) const;

  DiskShardConfig cfg_;
  std::timed_mutex mutex_;
  int lock_fd_{-1};
  int active_fd_{-1};

  Settings settings_;
  std::atomic<std::size_t> large_value_threshold_{32 * 1024};
  std::uint64_t settings_ino_{0};
  std::int64_t settings_mtime_ns_{0};

  std::unordered_map<std::string, IndexEntry> index_;
  std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;
  std::uint64_t generation_{0};
  std::uint32_t active_segment_{1};
  std::vector<std::uint32_t> segments_;
  std::uint64_t applied_offset_{0};
  std::uint64_t next_seq_{1};
  std::uint64_t live_bytes_{0};
  std::uint64_t total_segment_bytes_{0};
  std::uint64_t last_fsync_epoch_s_{0};

  HitStats counters_;
};

} // namespace fanout_cache
