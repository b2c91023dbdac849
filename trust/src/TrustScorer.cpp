#include "trust/TrustScorer.h"
#include <algorithm>
#include <cmath>
#include "trust/Precheck.h"
#include "trust/Util.h"

namespace trust {

namespace {
constexpr double kHoursPerDay = 24.0;

bool stored_digest_present(const std::optional<std::string>& stored) {
  return stored.has_value() && !stored->empty();
}

const std::optional<std::string>& stored_digest(const BaselineProfile& b, SignalId id) {
  return id == SignalId::DeviceHash ? b.device_hash : b.location_hash;
}

const std::string& current_digest(const BehaviorSample& s, SignalId id) {
  return id == SignalId::DeviceHash ? s.device_hash : s.location_hash;
}
} // namespace

double score_deviation(double current, double baseline, double weight, double d_max,
                       double epsilon) {
  double d = std::fabs(current - baseline) / std::max(baseline, epsilon);
  if (d_max == 0.0) {
    return d == 0.0 ? clamp_points(weight, weight) : 0.0;
  }
  return clamp_points(weight * std::max(0.0, 1.0 - d / d_max), weight);
}

double score_hard_cap(double current, double weight, double cap) {
  if (current <= cap) return clamp_points(weight, weight);
  if (!(cap > 0.0)) return 0.0;
  return clamp_points(weight * std::max(0.0, 1.0 - (current - cap) / cap), weight);
}

double score_binary_match(bool matched, double weight) {
  return matched ? clamp_points(weight, weight) : 0.0;
}

double score_circular_proximity(double current_hour, double baseline_hour, double weight,
                                double max_hours) {
  if (!(max_hours > 0.0)) return 0.0;
  double dist = circular_distance(current_hour, baseline_hour, kHoursPerDay);
  return clamp_points(weight * (1.0 - dist / max_hours), weight);
}

ScoreOutcome score(const BehaviorSample& sample, const BaselineProfile& baseline,
                   const ScoringConfig& cfg) {
  ScoreOutcome out{};
  auto sample_check = check_sample(sample);
  if (!sample_check.ok) {
    out.error = sample_check.reason;
    out.signal = sample_check.signal;
    return out;
  }
  auto baseline_check = check_baseline(baseline, cfg);
  if (!baseline_check.ok) {
    out.error = baseline_check.reason;
    out.signal = baseline_check.signal;
    return out;
  }

  ScoreResult& r = out.result;
  double budget = 0.0;
  double excluded_weight = 0.0;
  double sum = 0.0;

  for (const auto& spec : cfg.signals) {
    const std::string name = signal_name(spec.id);
    const double weight = std::isfinite(spec.weight) ? std::max(0.0, spec.weight) : 0.0;
    budget += weight;
    double pts = 0.0;

    if (!kind_allowed(spec.id, spec.kind)) {
      // Unchecked table with a nonsensical pairing; the signal earns nothing.
      r.sub_scores[name] = 0.0;
      continue;
    }

    switch (spec.kind) {
      case SignalKind::Deviation:
        pts = score_deviation(sample_value(sample, spec.id),
                              baseline_value(baseline, spec.id).value_or(0.0), weight,
                              spec.d_max, cfg.epsilon);
        break;
      case SignalKind::HardCap:
        pts = score_hard_cap(sample_value(sample, spec.id), weight, spec.cap);
        break;
      case SignalKind::BinaryMatch: {
        const auto& stored = stored_digest(baseline, spec.id);
        bool matched = digests_match(current_digest(sample, spec.id), stored);
        r.matched_flags[name] = matched;
        if (!stored_digest_present(stored) && cfg.missing_hash == MissingHashPolicy::Rescale) {
          excluded_weight += weight;
          r.excluded.push_back(name);
        }
        pts = score_binary_match(matched, weight);
        break;
      }
      case SignalKind::CircularProximity:
        pts = score_circular_proximity(static_cast<double>(sample.time_of_day),
                                       baseline.time_of_day.value_or(0.0), weight,
                                       spec.max_hours);
        break;
    }
    r.sub_scores[name] = pts;
    sum += pts;
  }

  if (excluded_weight > 0.0) {
    double effective = budget - excluded_weight;
    sum = effective > 0.0 ? sum * (budget / effective) : 0.0;
  }

  if (std::isnan(sum)) sum = 0.0;
  r.raw = sum;
  r.total = static_cast<int>(std::lround(std::clamp(sum, 0.0, kWeightBudget)));
  out.ok = true;
  out.error = InputError::None;
  return out;
}

RuleBasedScorer::RuleBasedScorer() : cfg_(default_scoring_config()) {}

RuleBasedScorer::RuleBasedScorer(const ScoringConfig& cfg) : cfg_(cfg) {}

ScoreOutcome RuleBasedScorer::score(const BehaviorSample& sample,
                                    const BaselineProfile& baseline) const {
  return trust::score(sample, baseline, cfg_);
}

} // namespace trust
