#include <tlsim/scenario.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <random>
#include <tlsim/csv.hpp>

namespace tlsim {

// Phase lengths whose millisecond count does not fit Millis are rejected.
static bool seconds_fit_millis(double s) {
  return std::fabs(s * 1000.0) < static_cast<double>(std::numeric_limits<Millis::rep>::max());
}

static Millis seconds_to_millis(double s) {
  return Millis(static_cast<Millis::rep>(std::llround(s * 1000.0)));
}

static bool id_in_range(long long id) {
  return id >= std::numeric_limits<int>::min() && id <= std::numeric_limits<int>::max();
}

static std::optional<Intersection> parse_intersection_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  bool ok_id, ok_x, ok_g, ok_y, ok_r;
  const long long id = csv::to_int(cols[1], ok_id);
  const double x = csv::to_double(cols[2], ok_x);
  const double g = csv::to_double(cols[3], ok_g);
  const double y = csv::to_double(cols[4], ok_y);
  const double r = csv::to_double(cols[5], ok_r);
  if (!(ok_id && ok_x && ok_g && ok_y && ok_r) || !id_in_range(id)) return std::nullopt;
  if (!seconds_fit_millis(g) || !seconds_fit_millis(y) || !seconds_fit_millis(r)) return std::nullopt;

  Intersection in;
  in.id = static_cast<IntersectionId>(id);
  in.x = x;
  in.green = seconds_to_millis(g);
  in.yellow = seconds_to_millis(y);
  in.red = seconds_to_millis(r);
  if (!durations_valid(in)) return std::nullopt;
  return in;
}

static std::optional<Car> parse_car_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  bool ok_id, ok_x, ok_s;
  const long long id = csv::to_int(cols[1], ok_id);
  const double x = csv::to_double(cols[2], ok_x);
  const double speed = csv::to_double(cols[3], ok_s);
  if (!(ok_id && ok_x && ok_s) || !id_in_range(id) || speed < 0.0) return std::nullopt;

  Car c;
  c.id = static_cast<CarId>(id);
  c.x = x;
  c.speed_mps = speed;
  return c;
}

Scenario scenario_from_csv_stream(std::istream& in) {
  Scenario out;
  std::string line;
  while (std::getline(in, line)) {
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    const auto kind = csv::lower(cols[0]);
    if (kind == "intersection") {
      if (auto row = parse_intersection_row(cols); row.has_value()) out.intersections.push_back(*row);
    } else if (kind == "car") {
      if (auto row = parse_car_row(cols); row.has_value()) out.cars.push_back(*row);
    }
  }
  return out;
}

std::optional<Scenario> load_scenario_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return scenario_from_csv_stream(f);
}

Scenario demo_scenario(std::uint64_t seed) {
  Scenario s;
  auto light = [&](IntersectionId id, double x, int g, int y, int r) {
    Intersection in;
    in.id = id;
    in.x = x;
    in.green = Millis(g * 1000);
    in.yellow = Millis(y * 1000);
    in.red = Millis(r * 1000);
    s.intersections.push_back(in);
  };
  light(1, 200.0, 10, 2, 12);
  light(2, 500.0,  8, 2, 10);
  light(3, 800.0, 12, 3, 15);

  std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
  std::uniform_real_distribution<double> U(0.0, 1.0);
  auto car = [&](CarId id, double x0, double speed0, double speed_span) {
    Car c;
    c.id = id;
    c.x = x0 + U(rng) * 50.0;
    c.speed_mps = speed0 + U(rng) * speed_span;
    s.cars.push_back(c);
  };
  car(1,  50.0, 10.0, 5.0);
  car(2, 300.0, 12.0, 4.0);
  car(3, 600.0,  8.0, 6.0);
  return s;
}

} // namespace tlsim
