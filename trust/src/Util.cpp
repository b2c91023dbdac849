#include "trust/Util.h"

namespace trust {

bool constant_time_eq(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  unsigned char r = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    r |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
  }
  return r == 0;
}

bool digests_match(const std::string& current, const std::optional<std::string>& stored) {
  if (!stored.has_value() || stored->empty() || current.empty()) return false;
  return constant_time_eq(current, *stored);
}

double circular_distance(double a, double b, double cycle) {
  double diff = std::fabs(a - b);
  if (cycle > 0.0) diff = std::fmod(diff, cycle);
  return std::min(diff, cycle - diff);
}

} // namespace trust
