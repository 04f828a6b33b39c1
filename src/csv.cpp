#include <tlsim/csv.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace tlsim::csv {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

double to_double(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size() && std::isfinite(v); // "nan" and "inf" parse too
    return v;
  } catch (const std::logic_error&) {
    ok = false;
    return 0.0;
  }
}

long long to_int(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    long long v = std::stoll(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::logic_error&) {
    ok = false;
    return 0;
  }
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace tlsim::csv
