#include "trust/Precheck.h"
#include <cassert>
#include <limits>
#include "Fixtures.h"

using namespace trust;

void test_precheck() {
  auto cfg = default_scoring_config();
  auto s = trust_test::reference_sample();
  auto b = trust_test::reference_baseline();
  assert(check_sample(s).ok);
  assert(check_baseline(b, cfg).ok);

  auto bad_hour = s;
  bad_hour.time_of_day = 24;
  auto r = check_sample(bad_hour);
  assert(!r.ok && r.reason == InputError::OutOfRange && r.signal == SignalId::TimeOfDay);
  bad_hour.time_of_day = -1;
  assert(!check_sample(bad_hour).ok);

  auto negative = s;
  negative.mouse_velocity = -1.0;
  r = check_sample(negative);
  assert(!r.ok && r.reason == InputError::NegativeValue && r.signal == SignalId::MouseVelocity);

  auto nan = s;
  nan.typing_speed = std::numeric_limits<double>::quiet_NaN();
  assert(check_sample(nan).reason == InputError::NonFiniteValue);

  auto deep = s;
  deep.scroll_depth = 1.5;
  assert(check_sample(deep).reason == InputError::OutOfRange);

  // Extreme but well-formed behavior is not an input error.
  auto extreme = s;
  extreme.network_latency = 1e7;
  extreme.typing_speed = 0.0;
  assert(check_sample(extreme).ok);

  auto missing = b;
  missing.key_hold_time.reset();
  r = check_baseline(missing, cfg);
  assert(!r.ok && r.reason == InputError::MissingField && r.signal == SignalId::KeyHoldTime);

  auto no_hour = b;
  no_hour.time_of_day.reset();
  assert(check_baseline(no_hour, cfg).reason == InputError::MissingField);

  auto inf = b;
  inf.click_interval = std::numeric_limits<double>::infinity();
  assert(check_baseline(inf, cfg).reason == InputError::NonFiniteValue);

  auto neg = b;
  neg.scroll_depth = -0.1;
  assert(check_baseline(neg, cfg).reason == InputError::NegativeValue);

  auto late = b;
  late.time_of_day = 24.0;
  assert(check_baseline(late, cfg).reason == InputError::OutOfRange);

  // Hard-cap latency and digests need no stored value.
  auto sparse = b;
  sparse.network_latency.reset();
  sparse.device_hash.reset();
  sparse.location_hash.reset();
  assert(check_baseline(sparse, cfg).ok);

  // Unless the table scores latency by deviation.
  for (auto& spec : cfg.signals) {
    if (spec.id == SignalId::NetworkLatency) spec.kind = SignalKind::Deviation;
  }
  r = check_baseline(sparse, cfg);
  assert(!r.ok && r.signal == SignalId::NetworkLatency);
}
