#include "fanout_cache/settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fanout_cache {
namespace {

bool parse_bool(const std::string &s, bool &out) {
  if (s == "1" || s == "true") {
    out = true;
    return true;
  }
  if (s == "0" || s == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(const std::string &s, std::size_t &out) {
  // stoull accepts a sign and wraps negatives around.
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    return false;
  try {
    std::size_t idx = 0;
    const auto v = std::stoull(s, &idx);
    if (idx != s.size())
      return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_ratio(const std::string &s, double &out) {
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size())
      return false;
    out = v;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string format_ratio(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

bool extract_scalar(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex quoted("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::regex bare("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?|true|false)");
  std::smatch m;
  if (std::regex_search(text, m, quoted) || std::regex_search(text, m, bare)) {
    out = m[1].str();
    return true;
  }
  return false;
}

} // namespace

const char *fsync_mode_name(FsyncMode mode) {
  switch (mode) {
  case FsyncMode::Never:
    return "never";
  case FsyncMode::Always:
    return "always";
  case FsyncMode::EverySec:
    break;
  }
  return "everysec";
}

const std::vector<std::string> &Settings::keys() {
  static const std::vector<std::string> k = {
      "statistics", "tag_index",            "sweep_batch", "large_value_threshold",
      "fsync",      "compaction_threshold"};
  return k;
}

bool Settings::is_known(const std::string &key) {
  const auto &k = keys();
  return std::find(k.begin(), k.end(), key) != k.end();
}

void Settings::apply(const std::string &key, const std::string &value) {
  bool ok = false;
  if (key == "statistics") {
    ok = parse_bool(value, statistics);
  } else if (key == "tag_index") {
    ok = parse_bool(value, tag_index);
  } else if (key == "sweep_batch") {
    std::size_t v = 0;
    ok = parse_size(value, v) && v > 0;
    if (ok)
      sweep_batch = v;
  } else if (key == "large_value_threshold") {
    std::size_t v = 0;
    ok = parse_size(value, v) && v > 0;
    if (ok)
      large_value_threshold = v;
  } else if (key == "fsync") {
    ok = true;
    if (value == "never")
      fsync = FsyncMode::Never;
    else if (value == "everysec")
      fsync = FsyncMode::EverySec;
    else if (value == "always")
      fsync = FsyncMode::Always;
    else
      ok = false;
  } else if (key == "compaction_threshold") {
    double v = 0.0;
    ok = parse_ratio(value, v) && v > 0.0 && v <= 1.0;
    if (ok)
      compaction_threshold = v;
  } else {
    throw std::invalid_argument("unknown setting: " + key);
  }
  if (!ok)
    throw std::invalid_argument("invalid value for " + key + ": " + value);
}

std::string Settings::get(const std::string &key) const {
  if (key == "statistics")
    return statistics ? "1" : "0";
  if (key == "tag_index")
    return tag_index ? "1" : "0";
  if (key == "sweep_batch")
    return std::to_string(sweep_batch);
  if (key == "large_value_threshold")
    return std::to_string(large_value_threshold);
  if (key == "fsync")
    return fsync_mode_name(fsync);
  if (key == "compaction_threshold")
    return format_ratio(compaction_threshold);
  throw std::invalid_argument("unknown setting: " + key);
}

SettingsOverrides Settings::to_map() const {
  SettingsOverrides out;
  for (const auto &k : keys())
    out[k] = get(k);
  return out;
}

std::string serialize_settings(const Settings &s) {
  std::ostringstream os;
  for (const auto &k : Settings::keys())
    os << k << "=" << s.get(k) << "\n";
  return os.str();
}

bool parse_settings(const std::string &text, Settings &out, std::string *err) {
  Settings parsed = out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#')
      continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      if (err)
        *err = "malformed settings line: " + line;
      return false;
    }
    const auto key = line.substr(0, eq);
    if (!Settings::is_known(key))
      continue;
    try {
      parsed.apply(key, line.substr(eq + 1));
    } catch (const std::invalid_argument &e) {
      if (err)
        *err = e.what();
      return false;
    }
  }
  out = parsed;
  return true;
}

bool load_settings_json(const std::string &path, SettingsOverrides &out,
                        std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "settings file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  // Validate against a scratch copy so a bad file changes nothing.
  Settings probe;
  SettingsOverrides found;
  for (const auto &key : Settings::keys()) {
    std::string v;
    if (!extract_scalar(text, key, v))
      continue;
    try {
      probe.apply(key, v);
    } catch (const std::invalid_argument &e) {
      if (err)
        *err = e.what();
      return false;
    }
    found[key] = v;
  }
  for (auto &[k, v] : found)
    out[k] = v;
  return true;
}

} // namespace fanout_cache
