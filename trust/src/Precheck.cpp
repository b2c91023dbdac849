#include "trust/Precheck.h"
#include <cmath>

namespace trust {

namespace {
constexpr double kHoursPerDay = 24.0;

InputCheck reject(InputError reason, SignalId id) {
  InputCheck res{};
  res.ok = false;
  res.reason = reason;
  res.signal = id;
  return res;
}

InputCheck pass() {
  InputCheck res{};
  res.ok = true;
  res.reason = InputError::None;
  return res;
}

bool needs_baseline(SignalKind kind) {
  return kind == SignalKind::Deviation || kind == SignalKind::CircularProximity;
}
} // namespace

InputCheck check_sample(const BehaviorSample& sample) {
  for (size_t i = 0; i < kSignalCount; ++i) {
    auto id = static_cast<SignalId>(i);
    if (is_hash_signal(id) || id == SignalId::TimeOfDay) continue;
    double v = sample_value(sample, id);
    if (!std::isfinite(v)) return reject(InputError::NonFiniteValue, id);
    if (v < 0.0) return reject(InputError::NegativeValue, id);
  }
  if (sample.scroll_depth > 1.0) return reject(InputError::OutOfRange, SignalId::ScrollDepth);
  if (sample.time_of_day < 0 || sample.time_of_day > 23) {
    return reject(InputError::OutOfRange, SignalId::TimeOfDay);
  }
  return pass();
}

InputCheck check_baseline(const BaselineProfile& baseline, const ScoringConfig& cfg) {
  for (const auto& spec : cfg.signals) {
    if (is_hash_signal(spec.id)) continue;
    auto v = baseline_value(baseline, spec.id);
    if (!v.has_value() && needs_baseline(spec.kind)) {
      return reject(InputError::MissingField, spec.id);
    }
  }
  for (size_t i = 0; i < kSignalCount; ++i) {
    auto id = static_cast<SignalId>(i);
    if (is_hash_signal(id)) continue;
    auto v = baseline_value(baseline, id);
    if (!v.has_value()) continue;
    if (!std::isfinite(*v)) return reject(InputError::NonFiniteValue, id);
    if (*v < 0.0) return reject(InputError::NegativeValue, id);
  }
  if (baseline.time_of_day.has_value() && *baseline.time_of_day >= kHoursPerDay) {
    return reject(InputError::OutOfRange, SignalId::TimeOfDay);
  }
  return pass();
}

} // namespace trust
