#include <tlsim/sim_runner.hpp>
#include <thread>
#include <spdlog/spdlog.h>

namespace tlsim {

SimRunner::SimRunner(double road_length_m)
  : store_(std::make_shared<WorldStore>()),
    ctl_(std::make_shared<Control>()),
    road_length_m_(road_length_m > 0.0 ? road_length_m : kDefaultRoadLengthM) {}

void SimRunner::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (ctl_->running.load()) return;
  worker_.join_for(kStopTimeout); // previous loop, if any

  std::uint64_t gen = 0;
  store_->write([&](World&) {
    // Bump the generation before raising running so a detached loop from an
    // earlier run can never pass its liveness check again.
    gen = ctl_->generation.fetch_add(1) + 1;
    ctl_->tick = 0;
    ctl_->sim_time = 0.0;
    ctl_->rebase.store(false);
    ctl_->paused.store(false);
    ctl_->running.store(true);
  });

  worker_.launch("SimRunner", [ctl = ctl_, store = store_, gen, len = road_length_m_]() {
    thread_main_(ctl, store, gen, len);
  });
  spdlog::info("SimRunner: started at {} Hz", kTicksPerSecond);
}

void SimRunner::pause() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (!ctl_->running.load() || ctl_->paused.load()) return;
  // Under the writer lock: once this returns no tick can still be mutating.
  store_->write([&](World&) { ctl_->paused.store(true); });
  spdlog::info("SimRunner: paused at tick {}", tick_count());
}

void SimRunner::resume() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (!ctl_->running.load() || !ctl_->paused.load()) return;
  ctl_->rebase_at.store(clock::now().time_since_epoch().count());
  ctl_->rebase.store(true);
  ctl_->paused.store(false);
  spdlog::info("SimRunner: resumed at tick {}", tick_count());
}

void SimRunner::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (!ctl_->running.load()) return;
  store_->write([&](World&) {
    ctl_->running.store(false);
    ctl_->paused.store(false);
  });
  worker_.join_for(kStopTimeout);
  spdlog::info("SimRunner: stopped at tick {}", tick_count());
}

bool SimRunner::step_once(double dt_sec) {
  return execute_tick_(*ctl_, *store_, dt_sec, road_length_m_, 0);
}

SimSnapshot SimRunner::snapshot() const {
  return store_->read([&](const World& w) {
    SimSnapshot s;
    s.sim_time = ctl_->sim_time;
    s.tick = ctl_->tick;
    s.state = state();
    s.cars = w.cars;
    s.intersections = w.intersections;
    return s;
  });
}

std::uint64_t SimRunner::tick_count() const {
  return store_->read([&](const World&) { return ctl_->tick; });
}

RunState SimRunner::state() const {
  if (!ctl_->running.load()) return RunState::Stopped;
  return ctl_->paused.load() ? RunState::Paused : RunState::Running;
}

bool SimRunner::execute_tick_(Control& ctl, WorldStore& store, double dt_sec,
                              double road_length_m, std::uint64_t generation) {
  return store.write([&](World& w) {
    if (ctl.paused.load()) return false;
    if (generation != 0 &&
        (!ctl.running.load() || ctl.generation.load() != generation)) return false;
    const double dt = dt_sec < 0.0 ? 0.0 : dt_sec;
    step_world(w, dt, road_length_m);
    ++ctl.tick;
    ctl.sim_time += dt;
    return true;
  });
}

void SimRunner::thread_main_(std::shared_ptr<Control> ctl, std::shared_ptr<WorldStore> store,
                             std::uint64_t generation, double road_length_m) {
  auto last = clock::now();
  auto next = last;

  while (ctl->running.load(std::memory_order_relaxed) &&
         ctl->generation.load() == generation) {
    if (!ctl->paused.load()) {
      const auto now = clock::now();
      if (ctl->rebase.exchange(false)) {
        last = clock::time_point(clock::duration(ctl->rebase_at.load()));
      }
      const double dt = std::chrono::duration<double>(now - last).count();
      last = now;
      if (execute_tick_(*ctl, *store, dt, road_length_m, generation)) {
        spdlog::debug("SimRunner: tick dt={:.3f}s", dt);
      }
    }

    next += kTickPeriod;
    std::this_thread::sleep_until(next);
  }
}

} // namespace tlsim
