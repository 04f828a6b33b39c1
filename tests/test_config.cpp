#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <tlsim/config.hpp>

using Catch::Approx;
using namespace tlsim;

TEST_CASE("Config defaults") {
  SimConfig cfg;
  REQUIRE(cfg.seed == 12345u);
  REQUIRE(cfg.pause_lights_on_pause);
  REQUIRE(cfg.render_scale == Approx(1.0));
  REQUIRE(cfg.road_length_m == Approx(1000.0));
  REQUIRE(cfg.log_level == "info");
}

TEST_CASE("Config rows override defaults") {
  std::istringstream in(
    "key,value\n"
    "# demo settings\n"
    "seed, 42\n"
    "pause_lights_on_pause,no\n"
    "render_scale,1.5\n"
    "\n"
    "road_length_m,2000\n"
    "log_level,DEBUG\n");
  const SimConfig cfg = config_from_csv_stream(in);
  REQUIRE(cfg.seed == 42u);
  REQUIRE_FALSE(cfg.pause_lights_on_pause);
  REQUIRE(cfg.render_scale == Approx(1.5));
  REQUIRE(cfg.road_length_m == Approx(2000.0));
  REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("Render scale is clamped") {
  std::istringstream lo("render_scale,0.1\n");
  REQUIRE(config_from_csv_stream(lo).render_scale == Approx(0.5));
  std::istringstream hi("render_scale,9\n");
  REQUIRE(config_from_csv_stream(hi).render_scale == Approx(2.0));
}

TEST_CASE("Bad config rows keep defaults") {
  std::istringstream in(
    "seed,-3\n"
    "pause_lights_on_pause,maybe\n"
    "road_length_m,0\n"
    "log_level,loud\n"
    "colour,blue\n"
    "render_scale\n");
  const SimConfig cfg = config_from_csv_stream(in);
  REQUIRE(cfg.seed == 12345u);
  REQUIRE(cfg.pause_lights_on_pause);
  REQUIRE(cfg.road_length_m == Approx(1000.0));
  REQUIRE(cfg.log_level == "info");
  REQUIRE(cfg.render_scale == Approx(1.0));
}

TEST_CASE("Missing config file yields nullopt") {
  REQUIRE_FALSE(load_config_csv("/nonexistent/tlsim.csv").has_value());
}

TEST_CASE("Non-finite config values keep defaults") {
  std::istringstream in(
    "render_scale,nan\n"
    "road_length_m,inf\n");
  const SimConfig cfg = config_from_csv_stream(in);
  REQUIRE(cfg.render_scale == Approx(1.0));
  REQUIRE(cfg.road_length_m == Approx(1000.0));
}
