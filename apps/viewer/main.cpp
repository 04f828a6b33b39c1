#include <string>
#include <spdlog/spdlog.h>
#include <tlsim/config.hpp>
#include <tlsim/scenario.hpp>
#include <tlsim/simulation.hpp>
#include <tlsim/viewer/app.hpp>

using namespace tlsim;

// Usage: tlsim_viewer [config.csv] [scenario.csv]
int main(int argc, char** argv) {
  SimConfig cfg;
  if (argc > 1) {
    if (auto loaded = load_config_csv(argv[1]); loaded.has_value()) {
      cfg = *loaded;
    } else {
      spdlog::warn("cannot open config '{}', using defaults", argv[1]);
    }
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  Simulation sim(cfg);
  Scenario scenario = demo_scenario(cfg.seed);
  if (argc > 2) {
    if (auto loaded = load_scenario_csv(argv[2]); loaded.has_value()) {
      scenario = *loaded;
    } else {
      spdlog::warn("cannot open scenario '{}', using demo", argv[2]);
    }
  }

  sim.start_lights();
  sim.load_scenario(scenario);
  sim.start_clock();

  ViewerApp app(sim);
  const int code = app.run();

  sim.shutdown();
  return code;
}
