#pragma once
#include <cmath>
#include <string>
#include "trust/Common.h"

namespace trust_test {

inline bool near(double a, double b, double tol = 1e-9) { return std::fabs(a - b) <= tol; }

inline std::string digest(char fill) { return std::string(64, fill); }

// Typical login from the reference user: small deviations, same device and place.
inline trust::BehaviorSample reference_sample() {
  trust::BehaviorSample s{};
  s.typing_speed = 4.2;
  s.key_hold_time = 112.5;
  s.mouse_velocity = 380.0;
  s.click_interval = 620.0;
  s.scroll_depth = 0.65;
  s.network_latency = 45.0;
  s.device_hash = digest('a');
  s.location_hash = digest('b');
  s.time_of_day = 14;
  return s;
}

inline trust::BaselineProfile reference_baseline() {
  trust::BaselineProfile b{};
  b.typing_speed = 4.0;
  b.key_hold_time = 110.0;
  b.mouse_velocity = 400.0;
  b.click_interval = 600.0;
  b.scroll_depth = 0.60;
  b.network_latency = 50.0;
  b.device_hash = digest('a');
  b.location_hash = digest('b');
  b.time_of_day = 14.0;
  return b;
}

// Sample equal to the baseline on every signal.
inline trust::BehaviorSample identical_sample(const trust::BaselineProfile& b) {
  trust::BehaviorSample s{};
  s.typing_speed = *b.typing_speed;
  s.key_hold_time = *b.key_hold_time;
  s.mouse_velocity = *b.mouse_velocity;
  s.click_interval = *b.click_interval;
  s.scroll_depth = *b.scroll_depth;
  s.network_latency = *b.network_latency;
  s.device_hash = *b.device_hash;
  s.location_hash = *b.location_hash;
  s.time_of_day = static_cast<int>(*b.time_of_day);
  return s;
}

} // namespace trust_test
