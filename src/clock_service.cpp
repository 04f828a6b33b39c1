#include <tlsim/clock_service.hpp>
#include <ctime>
#include <utility>
#include <spdlog/spdlog.h>

namespace tlsim {

std::string format_clock_time(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return std::string(buf);
}

ClockService::ClockService(std::chrono::milliseconds period)
  : period_(period.count() > 0 ? period : std::chrono::milliseconds(1000)),
    sh_(std::make_shared<Shared>()) {
  sh_->text = format_clock_time(std::chrono::system_clock::now());
}

void ClockService::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  std::uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> sl(sh_->mu);
    if (sh_->running) return;
    sh_->running = true;
    gen = ++sh_->generation;
  }
  sh_->cv.notify_all();
  worker_.join_for(period_); // previous loop, if any
  worker_.launch("ClockService", [sh = sh_, gen, period = period_]() {
    thread_main_(sh, gen, period);
  });
  spdlog::info("ClockService: started");
}

void ClockService::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> sl(sh_->mu);
    if (!sh_->running) return;
    sh_->running = false;
  }
  sh_->cv.notify_all();
  worker_.join_for(std::chrono::milliseconds(1000));
  spdlog::info("ClockService: stopped");
}

bool ClockService::is_running() const {
  std::lock_guard<std::mutex> sl(sh_->mu);
  return sh_->running;
}

std::string ClockService::current_time() const {
  std::lock_guard<std::mutex> sl(sh_->mu);
  return sh_->text;
}

void ClockService::set_listener(Listener fn) {
  std::lock_guard<std::mutex> sl(sh_->mu);
  sh_->listener = std::move(fn);
}

void ClockService::thread_main_(std::shared_ptr<Shared> sh, std::uint64_t generation,
                                std::chrono::milliseconds period) {
  using clock = std::chrono::steady_clock;
  auto next = clock::now();
  std::unique_lock<std::mutex> lock(sh->mu);
  while (sh->running && sh->generation == generation) {
    sh->text = format_clock_time(std::chrono::system_clock::now());
    if (sh->listener) {
      Listener fn = sh->listener;
      const std::string text = sh->text;
      lock.unlock();
      fn(text);
      lock.lock();
    }
    next += period;
    sh->cv.wait_until(lock, next, [&] {
      return !sh->running || sh->generation != generation;
    });
  }
}

} // namespace tlsim
