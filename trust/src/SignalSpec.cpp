#include "trust/SignalSpec.h"
#include <array>
#include <cmath>

namespace trust {

namespace {
SignalSpec deviation(SignalId id, double weight) {
  SignalSpec s{};
  s.id = id;
  s.weight = weight;
  s.kind = SignalKind::Deviation;
  return s;
}

ConfigCheck fail(ConfigError reason, SignalId id) {
  ConfigCheck c{};
  c.ok = false;
  c.reason = reason;
  c.signal = id;
  return c;
}
} // namespace

ScoringConfig default_scoring_config() {
  ScoringConfig cfg{};
  cfg.signals.reserve(kSignalCount);
  cfg.signals.push_back(deviation(SignalId::TypingSpeed, 15.0));
  cfg.signals.push_back(deviation(SignalId::KeyHoldTime, 15.0));
  cfg.signals.push_back(deviation(SignalId::MouseVelocity, 10.0));
  cfg.signals.push_back(deviation(SignalId::ClickInterval, 10.0));
  cfg.signals.push_back(deviation(SignalId::ScrollDepth, 10.0));

  SignalSpec latency{};
  latency.id = SignalId::NetworkLatency;
  latency.weight = 10.0;
  latency.kind = SignalKind::HardCap;
  latency.cap = 300.0;
  cfg.signals.push_back(latency);

  SignalSpec device{};
  device.id = SignalId::DeviceHash;
  device.weight = 15.0;
  device.kind = SignalKind::BinaryMatch;
  cfg.signals.push_back(device);

  SignalSpec location{};
  location.id = SignalId::LocationHash;
  location.weight = 10.0;
  location.kind = SignalKind::BinaryMatch;
  cfg.signals.push_back(location);

  SignalSpec hour{};
  hour.id = SignalId::TimeOfDay;
  hour.weight = 5.0;
  hour.kind = SignalKind::CircularProximity;
  hour.max_hours = 12.0;
  cfg.signals.push_back(hour);
  return cfg;
}

const char* kind_name(SignalKind k) {
  switch (k) {
    case SignalKind::Deviation: return "deviation";
    case SignalKind::HardCap: return "hard_cap";
    case SignalKind::BinaryMatch: return "binary_match";
    case SignalKind::CircularProximity: return "circular_proximity";
  }
  return "unknown";
}

std::optional<SignalKind> kind_from_name(const std::string& name) {
  if (name == "deviation") return SignalKind::Deviation;
  if (name == "hard_cap") return SignalKind::HardCap;
  if (name == "binary_match") return SignalKind::BinaryMatch;
  if (name == "circular_proximity") return SignalKind::CircularProximity;
  return std::nullopt;
}

const char* config_error_name(ConfigError e) {
  switch (e) {
    case ConfigError::None: return "none";
    case ConfigError::UnknownSignal: return "unknown_signal";
    case ConfigError::UnknownKind: return "unknown_kind";
    case ConfigError::DuplicateSignal: return "duplicate_signal";
    case ConfigError::IncompatibleKind: return "incompatible_kind";
    case ConfigError::NegativeWeight: return "negative_weight";
    case ConfigError::NonPositiveCap: return "non_positive_cap";
    case ConfigError::NonPositiveMaxHours: return "non_positive_max_hours";
    case ConfigError::NegativeDeviationLimit: return "negative_deviation_limit";
    case ConfigError::NonPositiveEpsilon: return "non_positive_epsilon";
    case ConfigError::WeightBudget: return "weight_budget";
    case ConfigError::MalformedConfig: return "malformed_config";
  }
  return "unknown";
}

bool kind_allowed(SignalId id, SignalKind kind) {
  if (is_hash_signal(id)) return kind == SignalKind::BinaryMatch;
  if (id == SignalId::TimeOfDay) return kind == SignalKind::CircularProximity;
  return kind == SignalKind::Deviation || kind == SignalKind::HardCap;
}

double total_weight(const ScoringConfig& cfg) {
  double sum = 0.0;
  for (const auto& s : cfg.signals) sum += s.weight;
  return sum;
}

ConfigCheck check_config(const ScoringConfig& cfg) {
  ConfigCheck res{};
  if (!(cfg.epsilon > 0.0) || !std::isfinite(cfg.epsilon)) {
    res.reason = ConfigError::NonPositiveEpsilon;
    return res;
  }
  std::array<bool, kSignalCount> seen{};
  for (const auto& s : cfg.signals) {
    auto idx = static_cast<size_t>(s.id);
    if (idx >= kSignalCount) {
      res.reason = ConfigError::UnknownSignal;
      return res;
    }
    if (seen[idx]) return fail(ConfigError::DuplicateSignal, s.id);
    seen[idx] = true;
    if (!kind_allowed(s.id, s.kind)) return fail(ConfigError::IncompatibleKind, s.id);
    if (!(s.weight >= 0.0) || !std::isfinite(s.weight)) return fail(ConfigError::NegativeWeight, s.id);
    if (s.kind == SignalKind::Deviation && !(s.d_max >= 0.0)) {
      return fail(ConfigError::NegativeDeviationLimit, s.id);
    }
    if (s.kind == SignalKind::HardCap && !(s.cap > 0.0)) return fail(ConfigError::NonPositiveCap, s.id);
    if (s.kind == SignalKind::CircularProximity && !(s.max_hours > 0.0)) {
      return fail(ConfigError::NonPositiveMaxHours, s.id);
    }
  }
  if (std::fabs(total_weight(cfg) - kWeightBudget) > 1e-9) {
    res.reason = ConfigError::WeightBudget;
    return res;
  }
  res.ok = true;
  res.reason = ConfigError::None;
  return res;
}

} // namespace trust
