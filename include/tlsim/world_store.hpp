#pragma once
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <tlsim/world.hpp>

namespace tlsim {

// The one writer-arbitration section for World. Car ticks, light color
// changes and administrative edits all take the exclusive lock; renderers
// take the shared lock.
class WorldStore {
public:
  WorldStore() = default;
  explicit WorldStore(World initial) : world_(std::move(initial)) {}
  WorldStore(const WorldStore&) = delete;
  WorldStore& operator=(const WorldStore&) = delete;

  template <class F>
  decltype(auto) write(F&& f) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return std::forward<F>(f)(world_);
  }

  template <class F>
  decltype(auto) read(F&& f) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return std::forward<F>(f)(static_cast<const World&>(world_));
  }

  // Point-in-time copy taken under the shared lock.
  World copy() const;
  void replace(World w);

  bool add_car(const Car& c);
  bool add_intersection(const Intersection& in);
  bool remove_car(CarId id);
  bool remove_intersection(IntersectionId id);

  // Returns false if the intersection no longer exists.
  bool set_light_color(IntersectionId id, LightColor c);

  std::optional<Intersection> intersection(IntersectionId id) const;
  std::optional<Car> car(CarId id) const;

private:
  mutable std::shared_mutex mu_;
  World world_;
};

} // namespace tlsim
