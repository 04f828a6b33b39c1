#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <string>
#include <tlsim/world.hpp>

using namespace tlsim;

static Intersection make_in(IntersectionId id, double x) {
  Intersection in;
  in.id = id;
  in.x = x;
  return in;
}

TEST_CASE("Intersections are kept sorted by position") {
  World w;
  REQUIRE(w.add_intersection(make_in(1, 500.0)));
  REQUIRE(w.add_intersection(make_in(2, 200.0)));
  REQUIRE(w.add_intersection(make_in(3, 800.0)));
  REQUIRE(w.add_intersection(make_in(4, 350.0)));

  REQUIRE(w.intersections.size() == 4);
  REQUIRE(w.intersections[0].id == 2);
  REQUIRE(w.intersections[1].id == 4);
  REQUIRE(w.intersections[2].id == 1);
  REQUIRE(w.intersections[3].id == 3);
}

TEST_CASE("Duplicate ids are rejected") {
  World w;
  REQUIRE(w.add_intersection(make_in(1, 100.0)));
  REQUIRE_FALSE(w.add_intersection(make_in(1, 300.0)));

  Car c; c.id = 5;
  REQUIRE(w.add_car(c));
  REQUIRE_FALSE(w.add_car(c));
  REQUIRE(w.cars.size() == 1);
}

TEST_CASE("Phase durations must be strictly positive") {
  World w;
  Intersection in = make_in(1, 100.0);
  in.yellow = Millis(0);
  REQUIRE_FALSE(durations_valid(in));
  REQUIRE_FALSE(w.add_intersection(in));

  in.yellow = Millis(-5);
  REQUIRE_FALSE(w.add_intersection(in));

  in.yellow = Millis(1);
  REQUIRE(w.add_intersection(in));
}

TEST_CASE("New intersections start red with default timing") {
  Intersection in;
  REQUIRE(in.color == LightColor::Red);
  REQUIRE(in.green == Millis(10000));
  REQUIRE(in.yellow == Millis(2000));
  REQUIRE(in.red == Millis(12000));
}

TEST_CASE("Removal and lookup by id") {
  World w;
  REQUIRE(w.add_intersection(make_in(1, 100.0)));
  REQUIRE(w.add_intersection(make_in(2, 200.0)));
  Car a; a.id = 10;
  Car b; b.id = 11;
  REQUIRE(w.add_car(a));
  REQUIRE(w.add_car(b));

  REQUIRE(w.remove_car(10));
  REQUIRE_FALSE(w.remove_car(10));
  REQUIRE(w.car_by_id(10) == nullptr);
  REQUIRE(w.car_by_id(11) != nullptr);

  REQUIRE(w.remove_intersection(1));
  REQUIRE(w.intersection_by_id(1) == nullptr);
  REQUIRE(w.intersection_by_id(2) != nullptr);
  REQUIRE(w.intersections.size() == 1);

  w.clear();
  REQUIRE(w.cars.empty());
  REQUIRE(w.intersections.empty());
}

TEST_CASE("color_name") {
  REQUIRE(std::string(color_name(LightColor::Green)) == "GREEN");
  REQUIRE(std::string(color_name(LightColor::Yellow)) == "YELLOW");
  REQUIRE(std::string(color_name(LightColor::Red)) == "RED");
}

TEST_CASE("Non-finite positions and speeds are rejected") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  World w;
  REQUIRE_FALSE(w.add_intersection(make_in(1, nan)));
  REQUIRE_FALSE(w.add_intersection(make_in(2, inf)));
  REQUIRE(w.add_intersection(make_in(3, 200.0)));
  REQUIRE(w.intersections.size() == 1);

  Car c;
  c.id = 1;
  c.x = nan;
  REQUIRE_FALSE(w.add_car(c));
  c.x = 10.0;
  c.speed_mps = inf;
  REQUIRE_FALSE(w.add_car(c));
  c.speed_mps = 12.0;
  REQUIRE(w.add_car(c));
}
