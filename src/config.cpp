#include <tlsim/config.hpp>
#include <algorithm>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>
#include <tlsim/csv.hpp>

namespace tlsim {

static bool parse_bool(const std::string& s, bool& ok) {
  const auto v = csv::lower(s);
  ok = true;
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  ok = false;
  return false;
}

static bool is_log_level(const std::string& s) {
  static const std::vector<std::string> levels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
  };
  return std::find(levels.begin(), levels.end(), s) != levels.end();
}

// Applies one row; returns false if key or value was rejected.
static bool apply_setting(SimConfig& cfg, const std::string& key, const std::string& value) {
  bool ok = false;
  if (key == "seed") {
    const long long v = csv::to_int(value, ok);
    if (!ok || v < 0) return false;
    cfg.seed = static_cast<std::uint64_t>(v);
  } else if (key == "pause_lights_on_pause") {
    const bool v = parse_bool(value, ok);
    if (!ok) return false;
    cfg.pause_lights_on_pause = v;
  } else if (key == "render_scale") {
    const double v = csv::to_double(value, ok);
    if (!ok) return false;
    cfg.render_scale = std::clamp(v, 0.5, 2.0);
  } else if (key == "road_length_m") {
    const double v = csv::to_double(value, ok);
    if (!ok || v <= 0.0) return false;
    cfg.road_length_m = v;
  } else if (key == "log_level") {
    const auto v = csv::lower(value);
    if (!is_log_level(v)) return false;
    cfg.log_level = v;
  } else {
    return false;
  }
  return true;
}

SimConfig config_from_csv_stream(std::istream& in) {
  SimConfig cfg;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    if (cols.size() < 2) continue;
    const auto key = csv::lower(cols[0]);

    if (!header_consumed && key == "key") {
      header_consumed = true;
      continue;
    }
    if (!apply_setting(cfg, key, cols[1])) {
      spdlog::warn("config: ignoring '{}' = '{}'", cols[0], cols[1]);
    }
  }
  return cfg;
}

std::optional<SimConfig> load_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_csv_stream(f);
}

} // namespace tlsim
