#include <tlsim/worker.hpp>

namespace tlsim {

bool Worker::join_for(std::chrono::milliseconds timeout) {
  if (!th_.joinable()) return true;
  if (th_.get_id() == std::this_thread::get_id()) {
    // Stopped from inside its own body; nothing to wait for.
    th_.detach();
    return true;
  }
  if (timeout.count() < 0) timeout = std::chrono::milliseconds(0);
  if (done_.valid() && done_.wait_for(timeout) == std::future_status::ready) {
    th_.join();
    return true;
  }
  spdlog::warn("{}: did not stop within {} ms, detaching", name_, timeout.count());
  th_.detach();
  return false;
}

} // namespace tlsim
