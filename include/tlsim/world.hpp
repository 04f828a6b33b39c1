#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

namespace tlsim {

using IntersectionId = int;
using CarId = int;
using Millis = std::chrono::milliseconds;

enum class LightColor : int {
  Green = 0,
  Yellow = 1,
  Red = 2
};

const char* color_name(LightColor c);

struct Intersection {
  IntersectionId id = 0;
  double x = 0.0;                    // meters along the road
  LightColor color = LightColor::Red;
  Millis green{10000};
  Millis yellow{2000};
  Millis red{12000};
};

struct Car {
  CarId id = 0;
  double x = 0.0;          // meters along the road
  double y = 0.0;          // lateral offset, pinned to 0 by the stepper
  double speed_mps = 0.0;  // constant speed
  int target_index = 0;    // index into World::intersections
};

// True when every phase duration is strictly positive.
bool durations_valid(const Intersection& in);

// Plain shared model. Holds no lock; see WorldStore.
struct World {
  std::vector<Intersection> intersections; // sorted by x on insertion
  std::vector<Car> cars;                   // insertion order

  // Rejects duplicate ids, non-positive durations and non-finite positions
  // or speeds.
  bool add_intersection(const Intersection& in);
  bool add_car(const Car& c);

  bool remove_intersection(IntersectionId id);
  bool remove_car(CarId id);

  const Intersection* intersection_by_id(IntersectionId id) const;
  Intersection*       intersection_by_id(IntersectionId id);
  const Car* car_by_id(CarId id) const;
  Car*       car_by_id(CarId id);

  void clear() { intersections.clear(); cars.clear(); }
};

} // namespace tlsim
