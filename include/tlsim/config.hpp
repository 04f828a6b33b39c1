#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <tlsim/stepper.hpp>

namespace tlsim {

// Settings owned by the shell and handed to the engine as plain values.
struct SimConfig {
  std::uint64_t seed = 12345;        // demo scenario seed
  bool pause_lights_on_pause = true;
  double render_scale = 1.0;         // clamped to [0.5, 2.0]
  double road_length_m = kDefaultRoadLengthM;
  std::string log_level = "info";
};

// Stream-based loader (test-friendly; no filesystem required).
// Rows are "key,value"; an optional "key,value" header, '#' comments and
// blank lines are ignored. Unknown keys and bad values are skipped, leaving
// the default in place.
SimConfig config_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<SimConfig> load_config_csv(const std::string& path);

} // namespace tlsim
