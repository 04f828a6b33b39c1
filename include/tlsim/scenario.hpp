#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <tlsim/world.hpp>

namespace tlsim {

struct Scenario {
  std::vector<Intersection> intersections;
  std::vector<Car> cars;
};

// Rows:
//   intersection,<id>,<x_m>,<green_s>,<yellow_s>,<red_s>
//   car,<id>,<x_m>,<speed_mps>
// '#' comments and blank lines are ignored; invalid rows are skipped.
Scenario scenario_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<Scenario> load_scenario_csv(const std::string& path);

// Three intersections at 200/500/800 m and three cars whose start positions
// and speeds are drawn from the seed. Same seed, same scenario.
Scenario demo_scenario(std::uint64_t seed);

// Next-id counter owned by the shell.
class IdAllocator {
public:
  explicit IdAllocator(int first = 1) : next_(first) {}
  int next() { return next_++; }
  int peek() const { return next_; }
  // Keeps future ids clear of one chosen elsewhere.
  void observe(int id) { if (id >= next_) next_ = id + 1; }
  void reset(int first = 1) { next_ = first; }

private:
  int next_;
};

} // namespace tlsim
