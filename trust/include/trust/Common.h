#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trust {

enum class SignalId : uint8_t {
  TypingSpeed = 0,
  KeyHoldTime,
  MouseVelocity,
  ClickInterval,
  ScrollDepth,
  NetworkLatency,
  DeviceHash,
  LocationHash,
  TimeOfDay,
};

constexpr size_t kSignalCount = 9;

enum class Verdict : uint8_t {
  Accept = 0,
  Deny = 1,
  Invalid = 2,
};

enum class RiskLevel : uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
};

enum class InputError : uint16_t {
  None = 0,
  MissingField,
  NegativeValue,
  NonFiniteValue,
  OutOfRange,
  WrongType,
  MalformedPayload,
};

// One login attempt as reported by the collector.
struct BehaviorSample {
  double typing_speed{0.0};    // chars/sec
  double key_hold_time{0.0};   // ms
  double mouse_velocity{0.0};  // px/sec
  double click_interval{0.0};  // ms
  double scroll_depth{0.0};    // [0,1]
  double network_latency{0.0}; // ms
  std::string device_hash{};
  std::string location_hash{};
  int time_of_day{0};          // hour [0,23]
};

// Stored reference values. Continuous fields are central tendencies; the hour
// is a mean and may be fractional. Empty hash strings count as absent.
struct BaselineProfile {
  std::optional<double> typing_speed{};
  std::optional<double> key_hold_time{};
  std::optional<double> mouse_velocity{};
  std::optional<double> click_interval{};
  std::optional<double> scroll_depth{};
  std::optional<double> network_latency{};
  std::optional<std::string> device_hash{};
  std::optional<std::string> location_hash{};
  std::optional<double> time_of_day{};
};

struct ScoreResult {
  int total{0};
  double raw{0.0};
  std::map<std::string, double> sub_scores{};
  std::map<std::string, bool> matched_flags{};
  std::vector<std::string> excluded{};
};

bool operator==(const ScoreResult& a, const ScoreResult& b);
inline bool operator!=(const ScoreResult& a, const ScoreResult& b) { return !(a == b); }

const char* signal_name(SignalId id);
std::optional<SignalId> signal_from_name(const std::string& name);
const char* input_error_name(InputError e);
const char* verdict_name(Verdict v);
const char* risk_level_name(RiskLevel r);

bool is_hash_signal(SignalId id);
double sample_value(const BehaviorSample& s, SignalId id);
std::optional<double> baseline_value(const BaselineProfile& b, SignalId id);

} // namespace trust
