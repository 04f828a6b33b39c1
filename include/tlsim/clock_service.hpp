#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <tlsim/worker.hpp>

namespace tlsim {

// Local wall-clock time as HH:MM:SS.
std::string format_clock_time(std::chrono::system_clock::time_point tp);

// Publishes the wall-clock readout once per period. Independent of the
// simulation; purely for shells.
class ClockService {
public:
  using Listener = std::function<void(const std::string&)>;

  explicit ClockService(std::chrono::milliseconds period = std::chrono::milliseconds(1000));
  ~ClockService() { stop(); }
  ClockService(const ClockService&) = delete;
  ClockService& operator=(const ClockService&) = delete;

  void start();
  void stop();
  bool is_running() const;

  // Last published value.
  std::string current_time() const;

  // Called from the clock thread on every publish. Set before start().
  void set_listener(Listener fn);

private:
  struct Shared {
    std::mutex mu;
    std::condition_variable cv;
    bool running = false;
    std::uint64_t generation = 0;
    std::string text;
    Listener listener;
  };

  static void thread_main_(std::shared_ptr<Shared> sh, std::uint64_t generation,
                           std::chrono::milliseconds period);

  std::chrono::milliseconds period_;
  std::shared_ptr<Shared> sh_;
  Worker worker_;
  std::mutex lifecycle_mu_;
};

} // namespace tlsim
