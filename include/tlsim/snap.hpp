#pragma once
#include <cstdint>
#include <vector>
#include <tlsim/world.hpp>

namespace tlsim {

enum class RunState : int {
  Stopped = 0,
  Running = 1,
  Paused = 2
};

inline const char* run_state_name(RunState s) {
  switch (s) {
    case RunState::Stopped: return "Stopped";
    case RunState::Running: return "Running";
    case RunState::Paused:  return "Paused";
  }
  return "Unknown";
}

// Consistent copy of world state for a renderer.
struct SimSnapshot {
  double sim_time = 0.0;      // accumulated simulated time (s)
  std::uint64_t tick = 0;     // executed ticks since start()
  RunState state = RunState::Stopped;
  std::vector<Car> cars;
  std::vector<Intersection> intersections;
};

} // namespace tlsim
