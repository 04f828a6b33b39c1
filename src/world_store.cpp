#include <tlsim/world_store.hpp>

namespace tlsim {

World WorldStore::copy() const {
  return read([](const World& w){ return w; });
}

void WorldStore::replace(World w) {
  write([&](World& cur){ cur = std::move(w); });
}

bool WorldStore::add_car(const Car& c) {
  return write([&](World& w){ return w.add_car(c); });
}

bool WorldStore::add_intersection(const Intersection& in) {
  return write([&](World& w){ return w.add_intersection(in); });
}

bool WorldStore::remove_car(CarId id) {
  return write([&](World& w){ return w.remove_car(id); });
}

bool WorldStore::remove_intersection(IntersectionId id) {
  return write([&](World& w){ return w.remove_intersection(id); });
}

bool WorldStore::set_light_color(IntersectionId id, LightColor c) {
  return write([&](World& w){
    Intersection* in = w.intersection_by_id(id);
    if (!in) return false;
    in->color = c;
    return true;
  });
}

std::optional<Intersection> WorldStore::intersection(IntersectionId id) const {
  return read([&](const World& w) -> std::optional<Intersection> {
    if (const Intersection* in = w.intersection_by_id(id)) return *in;
    return std::nullopt;
  });
}

std::optional<Car> WorldStore::car(CarId id) const {
  return read([&](const World& w) -> std::optional<Car> {
    if (const Car* c = w.car_by_id(id)) return *c;
    return std::nullopt;
  });
}

} // namespace tlsim
