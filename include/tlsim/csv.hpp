#pragma once
#include <string>
#include <vector>

namespace tlsim::csv {

std::string trim(std::string s);

// Simple CSV: no quoted fields.
std::vector<std::string> split_line(const std::string& line);

// ok is false for partial parses and non-finite values.
double to_double(const std::string& s, bool& ok);
long long to_int(const std::string& s, bool& ok);

std::string lower(std::string s);

} // namespace tlsim::csv
