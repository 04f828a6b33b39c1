#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <tlsim/snap.hpp>
#include <tlsim/stepper.hpp>
#include <tlsim/worker.hpp>
#include <tlsim/world_store.hpp>

namespace tlsim {

// Owns the world, the stepper thread and its lifecycle
// (Stopped -> Running <-> Paused -> Stopped).
class SimRunner {
public:
  static constexpr int kTicksPerSecond = 20;
  static constexpr std::chrono::milliseconds kTickPeriod{1000 / kTicksPerSecond};
  static constexpr std::chrono::milliseconds kStopTimeout{1000};

  explicit SimRunner(double road_length_m = kDefaultRoadLengthM);
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  // Control surface; every call is a no-op outside its source state.
  void start();
  void pause();
  void resume();
  void stop();

  // Runs one tick synchronously with an explicit dt. Refused while paused.
  bool step_once(double dt_sec);

  SimSnapshot snapshot() const;
  std::uint64_t tick_count() const;
  RunState state() const;
  bool is_running() const { return ctl_->running.load(); }
  bool is_paused() const { return ctl_->paused.load(); }

  double road_length() const { return road_length_m_; }

  // Shared handle for mutation by shells and the light service.
  const std::shared_ptr<WorldStore>& store() const { return store_; }

private:
  using clock = std::chrono::steady_clock;

  struct Control {
    std::atomic<bool> running{false};
    std::atomic<bool> paused{false};
    std::atomic<std::uint64_t> generation{0};
    std::atomic<bool> rebase{false};
    std::atomic<clock::rep> rebase_at{0};
    // Guarded by the store's writer lock.
    std::uint64_t tick = 0;
    double sim_time = 0.0;
  };

  static void thread_main_(std::shared_ptr<Control> ctl, std::shared_ptr<WorldStore> store,
                           std::uint64_t generation, double road_length_m);
  // generation 0 = synchronous step; otherwise the calling loop's generation.
  static bool execute_tick_(Control& ctl, WorldStore& store, double dt_sec,
                            double road_length_m, std::uint64_t generation);

  std::shared_ptr<WorldStore> store_;
  std::shared_ptr<Control> ctl_;
  Worker worker_;
  std::mutex lifecycle_mu_;
  double road_length_m_;
};

} // namespace tlsim
