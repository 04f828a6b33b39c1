#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <tlsim/worker.hpp>
#include <tlsim/world_store.hpp>

namespace tlsim {

// GREEN -> YELLOW -> RED -> GREEN ...
LightColor next_color(LightColor c);
Millis phase_duration(const Intersection& in, LightColor c);

// Countdown for one light phase. Time reported while paused is not consumed,
// so a resumed phase continues where it left off.
class PhaseClock {
public:
  using Duration = std::chrono::nanoseconds;

  void begin(Millis duration);
  void advance(Duration elapsed, bool paused);
  Duration remaining() const { return remaining_; }
  bool expired() const { return remaining_.count() <= 0; }

private:
  Duration remaining_{0};
};

struct LightServiceOptions {
  Millis poll_interval{100};  // pause/cancel polling granularity
  Millis stop_timeout{2000};  // total wait in stop() before detaching
};

// Cycles every registered intersection on its own thread. Color writes go
// through the WorldStore writer lock, same as car ticks.
class LightService {
public:
  explicit LightService(std::shared_ptr<WorldStore> store, LightServiceOptions opts = {});
  ~LightService() { stop(); }
  LightService(const LightService&) = delete;
  LightService& operator=(const LightService&) = delete;

  void start();
  void stop();
  void pause();
  void resume();

  // One task per intersection. Returns false when the service is stopped,
  // the intersection is unknown, or its task is already active.
  bool start_light(IntersectionId id);
  // Non-interrupting: the task notices at its next poll.
  bool stop_light(IntersectionId id);

  bool is_running() const;
  bool is_paused() const;
  std::size_t active_count() const;
  bool has_light(IntersectionId id) const;

private:
  struct Flags {
    std::atomic<bool> running{false};
    std::atomic<bool> paused{false};
  };
  struct TaskState {
    std::atomic<bool> cancel{false};
    std::atomic<bool> finished{false};
  };
  struct Task {
    std::shared_ptr<TaskState> state;
    Worker worker;
  };

  static void run_cycle_(IntersectionId id, const std::shared_ptr<WorldStore>& store,
                         const std::shared_ptr<Flags>& flags,
                         const std::shared_ptr<TaskState>& task, Millis poll);
  static bool wait_phase_(Millis duration, const Flags& flags, const TaskState& task, Millis poll);

  std::shared_ptr<WorldStore> store_;
  LightServiceOptions opts_;
  mutable std::mutex mu_;
  std::shared_ptr<Flags> flags_;  // replaced on each start()
  std::map<IntersectionId, Task> tasks_;
};

} // namespace tlsim
