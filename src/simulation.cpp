#include <tlsim/simulation.hpp>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace tlsim {

Simulation::Simulation(SimConfig cfg, LightServiceOptions light_opts,
                       std::chrono::milliseconds clock_period)
  : cfg_(std::move(cfg)),
    runner_(cfg_.road_length_m),
    lights_(runner_.store(), light_opts),
    clock_(clock_period) {}

void Simulation::start() {
  runner_.start();
}

void Simulation::pause() {
  runner_.pause();
  if (cfg_.pause_lights_on_pause) lights_.pause();
}

void Simulation::resume() {
  runner_.resume();
  if (lights_.is_paused()) lights_.resume();
}

void Simulation::stop() {
  // Lights keep cycling so their behavior stays observable without cars.
  runner_.stop();
}

void Simulation::start_lights() {
  lights_.start();
  const auto ids = runner_.store()->read([](const World& w) {
    std::vector<IntersectionId> out;
    out.reserve(w.intersections.size());
    for (const auto& in : w.intersections) out.push_back(in.id);
    return out;
  });
  for (IntersectionId id : ids) lights_.start_light(id);
}

void Simulation::stop_lights() {
  lights_.stop();
}

void Simulation::shutdown() {
  runner_.stop();
  lights_.stop();
  clock_.stop();
}

bool Simulation::add_car(CarId id, double x, double speed_mps) {
  Car c;
  c.id = id;
  c.x = x;
  c.speed_mps = speed_mps < 0.0 ? 0.0 : speed_mps;
  if (!runner_.store()->add_car(c)) {
    spdlog::warn("Simulation: car {} rejected (duplicate id or non-finite value)", id);
    return false;
  }
  car_ids_.observe(id);
  spdlog::info("Simulation: added car {} at x={:.1f} speed={:.1f}", id, x, c.speed_mps);
  return true;
}

bool Simulation::remove_car(CarId id) {
  return runner_.store()->remove_car(id);
}

bool Simulation::add_intersection(IntersectionId id, double x, Millis green, Millis yellow,
                                  Millis red) {
  Intersection in;
  in.id = id;
  in.x = x;
  in.green = green;
  in.yellow = yellow;
  in.red = red;
  if (!runner_.store()->add_intersection(in)) {
    spdlog::warn("Simulation: intersection {} rejected (duplicate id, non-finite x or non-positive phase)", id);
    return false;
  }
  intersection_ids_.observe(id);
  spdlog::info("Simulation: added intersection {} at x={:.1f}", id, x);
  // No-op unless the light service is running.
  lights_.start_light(id);
  return true;
}

bool Simulation::remove_intersection(IntersectionId id) {
  lights_.stop_light(id);
  return runner_.store()->remove_intersection(id);
}

std::optional<CarId> Simulation::spawn_car(double x, double speed_mps) {
  const CarId id = car_ids_.peek();
  if (!add_car(id, x, speed_mps)) return std::nullopt;
  return id;
}

std::optional<IntersectionId> Simulation::spawn_intersection(double x, Millis green, Millis yellow,
                                                             Millis red) {
  const IntersectionId id = intersection_ids_.peek();
  if (!add_intersection(id, x, green, yellow, red)) return std::nullopt;
  return id;
}

void Simulation::load_scenario(const Scenario& s) {
  const auto old_ids = runner_.store()->read([](const World& w) {
    std::vector<IntersectionId> out;
    for (const auto& in : w.intersections) out.push_back(in.id);
    return out;
  });
  for (IntersectionId id : old_ids) lights_.stop_light(id);

  World w;
  for (const auto& in : s.intersections) {
    if (!w.add_intersection(in)) spdlog::warn("Simulation: scenario intersection {} skipped", in.id);
  }
  for (const auto& c : s.cars) {
    if (!w.add_car(c)) spdlog::warn("Simulation: scenario car {} skipped", c.id);
  }
  const std::size_t n_int = w.intersections.size();
  const std::size_t n_car = w.cars.size();
  std::vector<IntersectionId> new_ids;
  for (const auto& in : w.intersections) new_ids.push_back(in.id);

  car_ids_.reset();
  intersection_ids_.reset();
  for (const auto& car : w.cars) car_ids_.observe(car.id);
  for (const auto& in : w.intersections) intersection_ids_.observe(in.id);

  runner_.store()->replace(std::move(w));
  for (IntersectionId id : new_ids) lights_.start_light(id);
  spdlog::info("Simulation: scenario loaded ({} intersections, {} cars)", n_int, n_car);
}

} // namespace tlsim
