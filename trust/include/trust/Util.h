#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>

namespace trust {

inline double clamp_points(double v, double hi) {
  if (!(hi > 0.0) || std::isnan(v)) return 0.0;
  return std::clamp(v, 0.0, hi);
}

// Length leaks; contents do not.
bool constant_time_eq(const std::string& a, const std::string& b);

// Empty or absent digests never match.
bool digests_match(const std::string& current, const std::optional<std::string>& stored);

double circular_distance(double a, double b, double cycle);

} // namespace trust
