#include <tlsim/stepper.hpp>
#include <cmath>

namespace tlsim {

static double wrap_road(double x, double road_length_m) {
  if (road_length_m <= 0.0 || x <= road_length_m) return x;
  return std::fmod(x, road_length_m);
}

void step_car(Car& car, const std::vector<Intersection>& intersections,
              double dt_sec, double road_length_m) {
  if (dt_sec < 0.0) dt_sec = 0.0;
  const double desired = car.x + car.speed_mps * dt_sec;

  if (intersections.empty()) {
    car.x = wrap_road(desired, road_length_m);
    car.y = 0.0;
    return;
  }

  const int n = static_cast<int>(intersections.size());
  if (car.target_index < 0 || car.target_index >= n) car.target_index = 0;

  const Intersection& target = intersections[static_cast<std::size_t>(car.target_index)];
  const double ix = target.x;
  const double stop_line = ix - kStoppingMarginM;

  const bool passed      = car.x > ix + kPassMarginM;
  const bool approaching = car.x < ix && desired >= stop_line;

  if (passed) {
    car.target_index = (car.target_index + 1) % n;
    car.x = desired;
  } else if (approaching && target.color == LightColor::Red) {
    // Stop on a dime: no deceleration, discrete clamp to the stop line.
    car.x = desired >= stop_line ? stop_line : desired;
  } else {
    car.x = desired;
  }
  car.y = 0.0;
}

void step_world(World& world, double dt_sec, double road_length_m) {
  for (auto& car : world.cars) {
    step_car(car, world.intersections, dt_sec, road_length_m);
  }
}

} // namespace tlsim
