#include <tlsim/light_service.hpp>
#include <algorithm>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace tlsim {

LightColor next_color(LightColor c) {
  switch (c) {
    case LightColor::Green:  return LightColor::Yellow;
    case LightColor::Yellow: return LightColor::Red;
    case LightColor::Red:    return LightColor::Green;
  }
  return LightColor::Green;
}

Millis phase_duration(const Intersection& in, LightColor c) {
  switch (c) {
    case LightColor::Green:  return in.green;
    case LightColor::Yellow: return in.yellow;
    case LightColor::Red:    return in.red;
  }
  return in.red;
}

// ---- PhaseClock ----

void PhaseClock::begin(Millis duration) {
  remaining_ = duration.count() > 0 ? std::chrono::duration_cast<Duration>(duration) : Duration{0};
}

void PhaseClock::advance(Duration elapsed, bool paused) {
  if (paused || elapsed.count() <= 0) return;
  remaining_ -= std::min(elapsed, remaining_);
}

// ---- LightService ----

LightService::LightService(std::shared_ptr<WorldStore> store, LightServiceOptions opts)
  : store_(std::move(store)), opts_(opts), flags_(std::make_shared<Flags>()) {
  if (opts_.poll_interval.count() <= 0) opts_.poll_interval = Millis(100);
}

void LightService::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (flags_->running.load()) return;
  // Fresh flags: a task detached by an earlier stop() keeps seeing its old,
  // stopped flags.
  flags_ = std::make_shared<Flags>();
  flags_->running.store(true);
  spdlog::info("LightService: started");
}

void LightService::stop() {
  std::map<IntersectionId, Task> stopping;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!flags_->running.load()) return;
    flags_->running.store(false);
    for (auto& [id, task] : tasks_) task.state->cancel.store(true);
    stopping.swap(tasks_);
  }

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + opts_.stop_timeout;
  std::size_t detached = 0;
  for (auto& [id, task] : stopping) {
    const auto left = std::chrono::duration_cast<Millis>(deadline - clock::now());
    if (!task.worker.join_for(std::max(left, Millis(0)))) ++detached;
  }
  if (detached > 0) {
    spdlog::warn("LightService: {} light task(s) forced down after {} ms", detached,
                 opts_.stop_timeout.count());
  }
  spdlog::info("LightService: stopped ({} lights)", stopping.size());
}

void LightService::pause() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!flags_->running.load() || flags_->paused.load()) return;
  flags_->paused.store(true);
  spdlog::info("LightService: paused");
}

void LightService::resume() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!flags_->running.load() || !flags_->paused.load()) return;
  flags_->paused.store(false);
  spdlog::info("LightService: resumed");
}

bool LightService::start_light(IntersectionId id) {
  std::map<IntersectionId, Task>::node_type stale;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!flags_->running.load()) return false;

    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
      if (!it->second.state->finished.load()) return false;
      stale = tasks_.extract(it); // ended on its own (intersection vanished)
    }
    if (!store_->intersection(id)) {
      spdlog::warn("LightService: no intersection {}, light not started", id);
      return false;
    }

    auto state = std::make_shared<TaskState>();
    Task& task = tasks_[id];
    task.state = state;
    task.worker.launch("Light-" + std::to_string(id),
                       [id, store = store_, flags = flags_, state, poll = opts_.poll_interval]() {
                         run_cycle_(id, store, flags, state, poll);
                       });
  }
  if (stale) stale.mapped().worker.join_for(opts_.stop_timeout);
  spdlog::info("LightService: started light for intersection {}", id);
  return true;
}

bool LightService::stop_light(IntersectionId id) {
  std::map<IntersectionId, Task>::node_type node;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    it->second.state->cancel.store(true);
    node = tasks_.extract(it);
  }
  node.mapped().worker.join_for(opts_.stop_timeout);
  spdlog::info("LightService: stopped light for intersection {}", id);
  return true;
}

bool LightService::is_running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return flags_->running.load();
}

bool LightService::is_paused() const {
  std::lock_guard<std::mutex> lock(mu_);
  return flags_->paused.load();
}

std::size_t LightService::active_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
    [](const auto& kv){ return !kv.second.state->finished.load(); }));
}

bool LightService::has_light(IntersectionId id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(id);
  return it != tasks_.end() && !it->second.state->finished.load();
}

void LightService::run_cycle_(IntersectionId id, const std::shared_ptr<WorldStore>& store,
                              const std::shared_ptr<Flags>& flags,
                              const std::shared_ptr<TaskState>& task, Millis poll) {
  LightColor color = LightColor::Green;
  while (flags->running.load() && !task->cancel.load()) {
    // Durations are re-read each phase so edits take effect on the next one.
    const auto in = store->intersection(id);
    if (!in || !store->set_light_color(id, color)) break;
    spdlog::debug("Light {}: {}", id, color_name(color));
    if (!wait_phase_(phase_duration(*in, color), *flags, *task, poll)) break;
    color = next_color(color);
  }
  task->finished.store(true);
}

bool LightService::wait_phase_(Millis duration, const Flags& flags, const TaskState& task,
                               Millis poll) {
  using clock = std::chrono::steady_clock;
  PhaseClock phase;
  phase.begin(duration);
  auto last = clock::now();

  while (!phase.expired()) {
    if (task.cancel.load() || !flags.running.load()) return false;
    const bool paused = flags.paused.load();
    const PhaseClock::Duration nap = paused
      ? std::chrono::duration_cast<PhaseClock::Duration>(poll)
      : std::min<PhaseClock::Duration>(poll, phase.remaining());
    std::this_thread::sleep_for(nap);

    const auto now = clock::now();
    phase.advance(now - last, paused || flags.paused.load());
    last = now;
  }
  return !task.cancel.load() && flags.running.load();
}

} // namespace tlsim
