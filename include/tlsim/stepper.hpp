#pragma once
#include <tlsim/world.hpp>

namespace tlsim {

inline constexpr double kStoppingMarginM = 5.0;  // halt this far before a red light
inline constexpr double kPassMarginM     = 2.0;  // past this, the intersection is cleared
inline constexpr double kDefaultRoadLengthM = 1000.0;

// Advance one car by dt seconds against the current light colors.
// Out-of-range target indices are reset to 0.
void step_car(Car& car, const std::vector<Intersection>& intersections,
              double dt_sec, double road_length_m = kDefaultRoadLengthM);

// One tick over every car in the world.
void step_world(World& world, double dt_sec, double road_length_m = kDefaultRoadLengthM);

} // namespace tlsim
