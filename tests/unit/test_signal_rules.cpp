#include "trust/TrustScorer.h"
#include "trust/Util.h"
#include <cassert>
#include <optional>
#include <string>
#include "Fixtures.h"

using namespace trust;
using trust_test::near;

void test_signal_rules() {
  // Deviation: partial credit, full zero at d_max, floor on zero baselines.
  assert(near(score_deviation(4.0, 4.0, 15.0, 1.0, 1e-6), 15.0));
  assert(near(score_deviation(4.2, 4.0, 15.0, 1.0, 1e-6), 14.25));
  assert(near(score_deviation(8.0, 4.0, 15.0, 1.0, 1e-6), 0.0));
  assert(near(score_deviation(12.0, 4.0, 15.0, 1.0, 1e-6), 0.0));
  assert(near(score_deviation(0.0, 4.0, 15.0, 1.0, 1e-6), 0.0));
  assert(near(score_deviation(6.0, 4.0, 10.0, 2.0, 1e-6), 7.5));
  assert(near(score_deviation(0.0, 0.0, 10.0, 1.0, 1e-6), 10.0));
  assert(near(score_deviation(0.5, 0.0, 10.0, 1.0, 1e-6), 0.0));
  assert(near(score_deviation(5.0, 4.0, 10.0, 0.0, 1e-6), 0.0));
  assert(near(score_deviation(4.0, 4.0, 10.0, -1.0, 1e-6), 10.0));
  // A negative limit follows the formula and clamps to full weight.
  assert(near(score_deviation(12.0, 4.0, 10.0, -1.0, 1e-6), 10.0));
  assert(near(score_deviation(5.0, 4.0, 10.0, 0.0, 1e-6), 0.0));

  double prev = 15.0;
  for (int step = 0; step <= 40; ++step) {
    double pts = score_deviation(100.0 + step * 5.0, 100.0, 15.0, 1.0, 1e-6);
    assert(pts <= prev);
    prev = pts;
  }

  // Hard cap: flat below the cap, linear to zero at twice the cap.
  assert(near(score_hard_cap(45.0, 10.0, 300.0), 10.0));
  assert(near(score_hard_cap(300.0, 10.0, 300.0), 10.0));
  assert(near(score_hard_cap(450.0, 10.0, 300.0), 5.0));
  assert(near(score_hard_cap(600.0, 10.0, 300.0), 0.0));
  assert(near(score_hard_cap(900.0, 10.0, 300.0), 0.0));
  assert(near(score_hard_cap(5.0, 10.0, 0.0), 0.0));

  // Binary match.
  assert(near(score_binary_match(true, 15.0), 15.0));
  assert(near(score_binary_match(false, 15.0), 0.0));
  auto a = trust_test::digest('a');
  assert(digests_match(a, std::optional<std::string>(a)));
  assert(!digests_match(a, std::optional<std::string>(trust_test::digest('c'))));
  assert(!digests_match(a, std::nullopt));
  assert(!digests_match(a, std::optional<std::string>("")));
  assert(!digests_match("", std::optional<std::string>("")));
  assert(!constant_time_eq("abc", "abcd"));

  // Circular proximity wraps around midnight.
  assert(near(circular_distance(1.0, 23.0, 24.0), 2.0));
  assert(near(circular_distance(23.0, 1.0, 24.0), 2.0));
  assert(near(circular_distance(2.0, 14.0, 24.0), 12.0));
  assert(near(circular_distance(14.0, 14.0, 24.0), 0.0));
  assert(near(score_circular_proximity(1.0, 23.0, 5.0, 12.0), 5.0 * (1.0 - 2.0 / 12.0)));
  assert(near(score_circular_proximity(2.0, 14.0, 5.0, 12.0), 0.0));
  assert(near(score_circular_proximity(14.0, 14.0, 5.0, 12.0), 5.0));
  assert(near(score_circular_proximity(20.0, 14.0, 5.0, 6.0), 0.0));
  assert(near(score_circular_proximity(14.5, 14.0, 5.0, 12.0), 5.0 * (1.0 - 0.5 / 12.0)));
}
