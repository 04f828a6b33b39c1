#include <tlsim/world.hpp>
#include <algorithm>
#include <cmath>

namespace tlsim {

const char* color_name(LightColor c) {
  switch (c) {
    case LightColor::Green:  return "GREEN";
    case LightColor::Yellow: return "YELLOW";
    case LightColor::Red:    return "RED";
  }
  return "UNKNOWN";
}

bool durations_valid(const Intersection& in) {
  return in.green.count() > 0 && in.yellow.count() > 0 && in.red.count() > 0;
}

bool World::add_intersection(const Intersection& in) {
  if (!durations_valid(in) || !std::isfinite(in.x)) return false;
  if (intersection_by_id(in.id)) return false;
  // Keep ordered by position; ties go after existing entries.
  auto it = std::upper_bound(intersections.begin(), intersections.end(), in.x,
                             [](double x, const Intersection& e){ return x < e.x; });
  intersections.insert(it, in);
  return true;
}

bool World::add_car(const Car& c) {
  if (!std::isfinite(c.x) || !std::isfinite(c.speed_mps)) return false;
  if (car_by_id(c.id)) return false;
  cars.push_back(c);
  return true;
}

bool World::remove_intersection(IntersectionId id) {
  auto it = std::find_if(intersections.begin(), intersections.end(),
                         [&](const Intersection& e){ return e.id == id; });
  if (it == intersections.end()) return false;
  intersections.erase(it);
  return true;
}

bool World::remove_car(CarId id) {
  auto it = std::find_if(cars.begin(), cars.end(), [&](const Car& c){ return c.id == id; });
  if (it == cars.end()) return false;
  cars.erase(it);
  return true;
}

const Intersection* World::intersection_by_id(IntersectionId id) const {
  for (const auto& e : intersections) if (e.id == id) return &e;
  return nullptr;
}
Intersection* World::intersection_by_id(IntersectionId id) {
  for (auto& e : intersections) if (e.id == id) return &e;
  return nullptr;
}

const Car* World::car_by_id(CarId id) const {
  for (const auto& c : cars) if (c.id == id) return &c;
  return nullptr;
}
Car* World::car_by_id(CarId id) {
  for (auto& c : cars) if (c.id == id) return &c;
  return nullptr;
}

} // namespace tlsim
