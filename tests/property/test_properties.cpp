#include "trust/TrustScorer.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <random>
#include <string>

using namespace trust;

namespace {
std::string random_digest(std::mt19937_64& rng) {
  static const char kHex[] = "0123456789abcdef";
  std::uniform_int_distribution<int> pick(0, 3);
  // Few distinct digests so matches and mismatches both occur.
  return std::string(64, kHex[pick(rng)]);
}
} // namespace

int main() {
  std::mt19937_64 rng(0x5eed);
  std::uniform_real_distribution<double> speed(0.0, 12.0);
  std::uniform_real_distribution<double> ms(0.0, 2000.0);
  std::uniform_real_distribution<double> frac(0.0, 1.0);
  std::uniform_int_distribution<int> hour(0, 23);
  std::bernoulli_distribution absent(0.2);

  auto cfg = default_scoring_config();
  auto rescale = cfg;
  rescale.missing_hash = MissingHashPolicy::Rescale;

  for (int i = 0; i < 20000; ++i) {
    BehaviorSample s{};
    s.typing_speed = speed(rng);
    s.key_hold_time = ms(rng);
    s.mouse_velocity = ms(rng);
    s.click_interval = ms(rng);
    s.scroll_depth = frac(rng);
    s.network_latency = ms(rng);
    s.device_hash = random_digest(rng);
    s.location_hash = random_digest(rng);
    s.time_of_day = hour(rng);

    BaselineProfile b{};
    b.typing_speed = speed(rng);
    b.key_hold_time = ms(rng);
    b.mouse_velocity = ms(rng);
    b.click_interval = ms(rng);
    b.scroll_depth = frac(rng);
    b.time_of_day = frac(rng) * 23.99;
    if (!absent(rng)) b.device_hash = random_digest(rng);
    if (!absent(rng)) b.location_hash = random_digest(rng);

    auto out = score(s, b, cfg);
    assert(out.ok);
    const auto& r = out.result;
    assert(r.total >= 0 && r.total <= 100);

    double sum = 0.0;
    for (const auto& spec : cfg.signals) {
      double pts = r.sub_scores.at(signal_name(spec.id));
      assert(pts >= 0.0 && pts <= spec.weight);
      sum += pts;
    }
    assert(std::fabs(sum - r.raw) < 1e-9);
    assert(r.total == static_cast<int>(std::lround(std::clamp(r.raw, 0.0, 100.0))));

    // Identical inputs, identical result.
    assert(score(s, b, cfg).result == r);

    // Rescaling never lowers the score, and only moves it when a digest is absent.
    auto scaled = score(s, b, rescale);
    assert(scaled.ok && scaled.result.total >= r.total);
    if (b.device_hash && b.location_hash) assert(scaled.result == r);

    // Moving one deviation signal further from its baseline never helps it.
    auto further = s;
    further.key_hold_time = s.key_hold_time >= *b.key_hold_time ? s.key_hold_time + 25.0
                                                                  : std::max(0.0, s.key_hold_time - 25.0);
    auto worse = score(further, b, cfg);
    assert(worse.result.sub_scores.at("key_hold_time") <= r.sub_scores.at("key_hold_time"));
  }
  return 0;
}
