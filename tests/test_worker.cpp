#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <tlsim/worker.hpp>

using namespace tlsim;
using namespace std::chrono_literals;

TEST_CASE("Worker joins a body that finishes in time") {
  Worker w;
  auto ran = std::make_shared<std::atomic<bool>>(false);
  w.launch("quick", [ran]() { ran->store(true); });
  REQUIRE(w.join_for(500ms));
  REQUIRE(ran->load());
  REQUIRE_FALSE(w.joinable());
  REQUIRE(w.join_for(0ms));
}

TEST_CASE("Worker detaches a body that overruns the timeout") {
  Worker w;
  auto release = std::make_shared<std::atomic<bool>>(false);
  w.launch("slow", [release]() {
    while (!release->load()) std::this_thread::sleep_for(5ms);
  });
  REQUIRE_FALSE(w.join_for(20ms));
  REQUIRE_FALSE(w.joinable());
  release->store(true);
}

TEST_CASE("A throwing body still reports completion") {
  SECTION("std::exception") {
    Worker w;
    w.launch("throws", []() { throw std::runtime_error("boom"); });
    REQUIRE(w.join_for(500ms));
  }
  SECTION("non-standard exception") {
    Worker w;
    w.launch("throws-int", []() { throw 42; });
    REQUIRE(w.join_for(500ms));
  }
}
