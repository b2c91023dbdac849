#include "trust/Common.h"
#include <array>

namespace trust {

namespace {
constexpr std::array<const char*, kSignalCount> kSignalNames = {
    "typing_speed",   "key_hold_time",   "mouse_velocity",
    "click_interval", "scroll_depth",    "network_latency",
    "device_hash",    "location_hash",   "time_of_day",
};
}

bool operator==(const ScoreResult& a, const ScoreResult& b) {
  return a.total == b.total && a.raw == b.raw && a.sub_scores == b.sub_scores &&
         a.matched_flags == b.matched_flags && a.excluded == b.excluded;
}

const char* signal_name(SignalId id) {
  auto idx = static_cast<size_t>(id);
  return idx < kSignalNames.size() ? kSignalNames[idx] : "unknown";
}

std::optional<SignalId> signal_from_name(const std::string& name) {
  for (size_t i = 0; i < kSignalNames.size(); ++i) {
    if (name == kSignalNames[i]) return static_cast<SignalId>(i);
  }
  return std::nullopt;
}

const char* input_error_name(InputError e) {
  switch (e) {
    case InputError::None: return "none";
    case InputError::MissingField: return "missing_field";
    case InputError::NegativeValue: return "negative_value";
    case InputError::NonFiniteValue: return "non_finite_value";
    case InputError::OutOfRange: return "out_of_range";
    case InputError::WrongType: return "wrong_type";
    case InputError::MalformedPayload: return "malformed_payload";
  }
  return "unknown";
}

const char* verdict_name(Verdict v) {
  switch (v) {
    case Verdict::Accept: return "accept";
    case Verdict::Deny: return "deny";
    case Verdict::Invalid: return "invalid";
  }
  return "unknown";
}

const char* risk_level_name(RiskLevel r) {
  switch (r) {
    case RiskLevel::Low: return "LOW";
    case RiskLevel::Medium: return "MEDIUM";
    case RiskLevel::High: return "HIGH";
  }
  return "unknown";
}

bool is_hash_signal(SignalId id) {
  return id == SignalId::DeviceHash || id == SignalId::LocationHash;
}

double sample_value(const BehaviorSample& s, SignalId id) {
  switch (id) {
    case SignalId::TypingSpeed: return s.typing_speed;
    case SignalId::KeyHoldTime: return s.key_hold_time;
    case SignalId::MouseVelocity: return s.mouse_velocity;
    case SignalId::ClickInterval: return s.click_interval;
    case SignalId::ScrollDepth: return s.scroll_depth;
    case SignalId::NetworkLatency: return s.network_latency;
    case SignalId::TimeOfDay: return static_cast<double>(s.time_of_day);
    case SignalId::DeviceHash:
    case SignalId::LocationHash:
      break;
  }
  return 0.0;
}

std::optional<double> baseline_value(const BaselineProfile& b, SignalId id) {
  switch (id) {
    case SignalId::TypingSpeed: return b.typing_speed;
    case SignalId::KeyHoldTime: return b.key_hold_time;
    case SignalId::MouseVelocity: return b.mouse_velocity;
    case SignalId::ClickInterval: return b.click_interval;
    case SignalId::ScrollDepth: return b.scroll_depth;
    case SignalId::NetworkLatency: return b.network_latency;
    case SignalId::TimeOfDay: return b.time_of_day;
    case SignalId::DeviceHash:
    case SignalId::LocationHash:
      break;
  }
  return std::nullopt;
}

} // namespace trust
