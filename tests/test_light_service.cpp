#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include <tlsim/light_service.hpp>

using Catch::Approx;
using namespace tlsim;
using namespace std::chrono_literals;

static std::shared_ptr<WorldStore> store_with(IntersectionId id, Millis g, Millis y, Millis r) {
  auto store = std::make_shared<WorldStore>();
  Intersection in;
  in.id = id;
  in.x = 100.0;
  in.green = g;
  in.yellow = y;
  in.red = r;
  store->add_intersection(in);
  return store;
}

static LightColor color_of(const WorldStore& store, IntersectionId id) {
  return store.intersection(id)->color;
}

TEST_CASE("Light phases cycle green, yellow, red") {
  REQUIRE(next_color(LightColor::Green) == LightColor::Yellow);
  REQUIRE(next_color(LightColor::Yellow) == LightColor::Red);
  REQUIRE(next_color(LightColor::Red) == LightColor::Green);

  Intersection in;
  in.green = Millis(10000); in.yellow = Millis(2000); in.red = Millis(12000);
  REQUIRE(phase_duration(in, LightColor::Green) == Millis(10000));
  REQUIRE(phase_duration(in, LightColor::Yellow) == Millis(2000));
  REQUIRE(phase_duration(in, LightColor::Red) == Millis(12000));
}

TEST_CASE("PhaseClock does not consume paused time") {
  PhaseClock pc;
  pc.begin(Millis(1000));
  REQUIRE_FALSE(pc.expired());

  pc.advance(400ms, false);
  REQUIRE(pc.remaining() == 600ms);

  pc.advance(5s, true);               // paused: deadline frozen
  REQUIRE(pc.remaining() == 600ms);

  pc.advance(700ms, false);
  REQUIRE(pc.expired());
  REQUIRE(pc.remaining().count() == 0);

  pc.begin(Millis(-5));
  REQUIRE(pc.expired());
}

TEST_CASE("start_light needs a running service and a known intersection") {
  auto store = store_with(1, 300ms, 100ms, 300ms);
  LightService lights(store, LightServiceOptions{10ms, 1000ms});

  REQUIRE_FALSE(lights.start_light(1));       // service stopped
  lights.start();
  REQUIRE(lights.is_running());
  REQUIRE_FALSE(lights.start_light(42));      // unknown intersection
  REQUIRE(lights.start_light(1));
  REQUIRE_FALSE(lights.start_light(1));       // one task per intersection
  REQUIRE(lights.active_count() == 1);
  REQUIRE(lights.has_light(1));

  std::this_thread::sleep_for(50ms);
  REQUIRE(color_of(*store, 1) == LightColor::Green);
  lights.stop();
  REQUIRE(lights.active_count() == 0);
}

TEST_CASE("A light walks through every phase in order") {
  auto store = store_with(1, 150ms, 100ms, 150ms);
  LightService lights(store, LightServiceOptions{10ms, 1000ms});
  lights.start();
  REQUIRE(lights.start_light(1));

  std::vector<LightColor> seen;
  const auto until = std::chrono::steady_clock::now() + 600ms;
  while (std::chrono::steady_clock::now() < until) {
    const LightColor c = color_of(*store, 1);
    if (seen.empty() || seen.back() != c) seen.push_back(c);
    std::this_thread::sleep_for(5ms);
  }
  lights.stop();

  REQUIRE(seen.size() >= 4);
  REQUIRE(seen[0] == LightColor::Green);
  REQUIRE(seen[1] == LightColor::Yellow);
  REQUIRE(seen[2] == LightColor::Red);
  REQUIRE(seen[3] == LightColor::Green);
}

TEST_CASE("Time in each color matches the configured durations") {
  // G=10s, Y=2s, R=12s scaled down by 20.
  auto store = store_with(1, 500ms, 100ms, 600ms);
  LightService lights(store);                 // default 100 ms polling
  lights.start();
  REQUIRE(lights.start_light(1));

  int green = 0, yellow = 0, red = 0, total = 0;
  const auto until = std::chrono::steady_clock::now() + 1200ms;
  while (std::chrono::steady_clock::now() < until) {
    switch (color_of(*store, 1)) {
      case LightColor::Green:  ++green;  break;
      case LightColor::Yellow: ++yellow; break;
      case LightColor::Red:    ++red;    break;
    }
    ++total;
    std::this_thread::sleep_for(2ms);
  }
  lights.stop();

  REQUIRE(total > 0);
  // Each share within one polling interval (100 ms of 1200 ms).
  REQUIRE(double(green)  / total == Approx(500.0 / 1200.0).margin(0.09));
  REQUIRE(double(yellow) / total == Approx(100.0 / 1200.0).margin(0.09));
  REQUIRE(double(red)    / total == Approx(600.0 / 1200.0).margin(0.09));
}

TEST_CASE("Pausing mid-phase does not advance the phase deadline") {
  auto store = store_with(1, 400ms, 400ms, 400ms);
  LightService lights(store, LightServiceOptions{10ms, 1000ms});
  lights.start();
  REQUIRE(lights.start_light(1));

  std::this_thread::sleep_for(200ms);        // ~200 ms of green left
  lights.pause();
  lights.pause();
  REQUIRE(lights.is_paused());
  std::this_thread::sleep_for(600ms);        // longer than the whole phase
  REQUIRE(color_of(*store, 1) == LightColor::Green);

  lights.resume();
  REQUIRE_FALSE(lights.is_paused());
  std::this_thread::sleep_for(80ms);
  REQUIRE(color_of(*store, 1) == LightColor::Green); // remainder, not a restart
  std::this_thread::sleep_for(220ms);
  REQUIRE(color_of(*store, 1) == LightColor::Yellow);
  lights.stop();
}

TEST_CASE("stop_light freezes that intersection only") {
  auto store = std::make_shared<WorldStore>();
  for (IntersectionId id : {1, 2}) {
    Intersection in;
    in.id = id;
    in.x = 100.0 * id;
    in.green = 60ms; in.yellow = 60ms; in.red = 60ms;
    REQUIRE(store->add_intersection(in));
  }
  LightService lights(store, LightServiceOptions{10ms, 1000ms});
  lights.start();
  REQUIRE(lights.start_light(1));
  REQUIRE(lights.start_light(2));
  REQUIRE(lights.active_count() == 2);

  REQUIRE(lights.stop_light(1));
  REQUIRE_FALSE(lights.stop_light(1));
  REQUIRE_FALSE(lights.has_light(1));
  REQUIRE(lights.has_light(2));

  const LightColor frozen = color_of(*store, 1);
  std::this_thread::sleep_for(250ms);
  REQUIRE(color_of(*store, 1) == frozen);
  lights.stop();
}

TEST_CASE("Service stop cancels everything and can restart") {
  auto store = store_with(1, 50ms, 50ms, 50ms);
  LightService lights(store, LightServiceOptions{10ms, 500ms});
  lights.start();
  REQUIRE(lights.start_light(1));

  const auto t0 = std::chrono::steady_clock::now();
  lights.stop();
  lights.stop();
  REQUIRE(std::chrono::steady_clock::now() - t0 < 500ms);
  REQUIRE_FALSE(lights.is_running());
  REQUIRE(lights.active_count() == 0);

  lights.pause();                            // stopped: no-op
  REQUIRE_FALSE(lights.is_paused());

  lights.start();
  REQUIRE(lights.start_light(1));
  lights.stop();
}

TEST_CASE("A task ends when its intersection disappears") {
  auto store = store_with(1, 40ms, 40ms, 40ms);
  LightService lights(store, LightServiceOptions{10ms, 1000ms});
  lights.start();
  REQUIRE(lights.start_light(1));

  REQUIRE(store->remove_intersection(1));
  std::this_thread::sleep_for(200ms);
  REQUIRE_FALSE(lights.has_light(1));

  Intersection in;
  in.id = 1; in.x = 50.0;
  in.green = 40ms; in.yellow = 40ms; in.red = 40ms;
  REQUIRE(store->add_intersection(in));
  REQUIRE(lights.start_light(1));
  lights.stop();
}
