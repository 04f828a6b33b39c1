#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace tlsim {

// std::thread whose body reports completion, so an owner can bound how long
// it waits at shutdown. The body must only touch state it shares ownership
// of: a thread that misses the deadline is detached.
class Worker {
public:
  Worker() = default;
  ~Worker() { join_for(std::chrono::milliseconds(1000)); }
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = default;

  template <class F>
  void launch(std::string name, F body) {
    std::promise<void> done;
    done_ = done.get_future();
    name_ = std::move(name);
    th_ = std::thread([body = std::move(body), done = std::move(done), name = name_]() mutable {
      try {
        body();
      } catch (const std::exception& e) {
        spdlog::error("{}: loop terminated: {}", name, e.what());
      } catch (...) {
        spdlog::error("{}: loop terminated by a non-standard exception", name);
      }
      done.set_value();
    });
  }

  bool joinable() const { return th_.joinable(); }
  const std::string& name() const { return name_; }

  // Joins if the body finishes within timeout; otherwise logs, detaches and
  // returns false.
  bool join_for(std::chrono::milliseconds timeout);

private:
  std::thread th_;
  std::future<void> done_;
  std::string name_;
};

} // namespace tlsim
