#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fanout_cache {

enum class FsyncMode { Never, EverySec, Always };

using SettingsOverrides = std::map<std::string, std::string>;

struct Settings {
  bool statistics{false};
  bool tag_index{false};
  std::size_t sweep_batch{100};
  std::size_t large_value_threshold{32 * 1024};
  FsyncMode fsync{FsyncMode::EverySec};
  double compaction_threshold{0.5};

  // Throws std::invalid_argument for unknown keys or unparsable values.
  void apply(const std::string &key, const std::string &value);
  std::string get(const std::string &key) const;

  SettingsOverrides to_map() const;
  static const std::vector<std::string> &keys();
  static bool is_known(const std::string &key);
};

// key=value lines, one per setting.
std::string serialize_settings(const Settings &s);
bool parse_settings(const std::string &text, Settings &out,
                    std::string *err = nullptr);

// Flat JSON object of known settings, e.g. {"sweep_batch": 50,
// "fsync": "always"}. Unknown keys are ignored.
bool load_settings_json(const std::string &path, SettingsOverrides &out,
                        std::string *err = nullptr);

const char *fsync_mode_name(FsyncMode mode);

} // namespace fanout_cache
