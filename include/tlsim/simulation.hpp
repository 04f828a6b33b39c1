#pragma once
#include <optional>
#include <string>
#include <tlsim/clock_service.hpp>
#include <tlsim/config.hpp>
#include <tlsim/light_service.hpp>
#include <tlsim/scenario.hpp>
#include <tlsim/sim_runner.hpp>

namespace tlsim {

// Wires the runner, light cycling and clock together the way a shell drives
// them: pause optionally freezes the lights too, stop leaves lights cycling,
// and intersections added while lights run get their task immediately.
class Simulation {
public:
  explicit Simulation(SimConfig cfg = {}, LightServiceOptions light_opts = {},
                      std::chrono::milliseconds clock_period = std::chrono::milliseconds(1000));
  ~Simulation() { shutdown(); }
  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // Stepper lifecycle
  void start();
  void pause();
  void resume();
  void stop();

  // Light cycling for every intersection currently in the world.
  void start_lights();
  void stop_lights();

  void start_clock() { clock_.start(); }
  void stop_clock() { clock_.stop(); }
  std::string current_time() const { return clock_.current_time(); }

  void shutdown();

  bool add_car(CarId id, double x, double speed_mps);
  bool remove_car(CarId id);
  bool add_intersection(IntersectionId id, double x, Millis green, Millis yellow, Millis red);
  bool remove_intersection(IntersectionId id);

  // Same as above with the next free id; nullopt if the world rejected it.
  // Id allocation is not synchronized: call from the shell thread.
  std::optional<CarId> spawn_car(double x, double speed_mps);
  std::optional<IntersectionId> spawn_intersection(double x, Millis green = Millis(10000),
                                                   Millis yellow = Millis(2000),
                                                   Millis red = Millis(12000));

  // Replaces the world; light tasks follow the new intersections.
  void load_scenario(const Scenario& s);

  SimSnapshot snapshot() const { return runner_.snapshot(); }

  const SimConfig& config() const { return cfg_; }
  void set_pause_lights_on_pause(bool on) { cfg_.pause_lights_on_pause = on; }

  SimRunner& runner() { return runner_; }
  const SimRunner& runner() const { return runner_; }
  LightService& lights() { return lights_; }
  const LightService& lights() const { return lights_; }

private:
  SimConfig cfg_;
  SimRunner runner_;
  LightService lights_;
  ClockService clock_;
  IdAllocator car_ids_;
  IdAllocator intersection_ids_;
};

} // namespace tlsim
