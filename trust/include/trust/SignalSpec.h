#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Common.h"

namespace trust {

enum class SignalKind : uint8_t {
  Deviation = 0,
  HardCap,
  BinaryMatch,
  CircularProximity,
};

// Absent baseline digest: award zero, or drop the signal from the budget and
// rescale the rest.
enum class MissingHashPolicy : uint8_t {
  ZeroPoints = 0,
  Rescale = 1,
};

struct SignalSpec {
  SignalId id{SignalId::TypingSpeed};
  double weight{0.0};
  SignalKind kind{SignalKind::Deviation};
  double d_max{1.0};      // Deviation: relative deviation that zeroes the signal.
  double cap{300.0};      // HardCap: full credit at or below.
  double max_hours{12.0}; // CircularProximity: distance that zeroes the signal.
};

struct ScoringConfig {
  std::vector<SignalSpec> signals{};
  double epsilon{1e-6};
  MissingHashPolicy missing_hash{MissingHashPolicy::ZeroPoints};
};

enum class ConfigError : uint16_t {
  None = 0,
  UnknownSignal,
  UnknownKind,
  DuplicateSignal,
  IncompatibleKind,
  NegativeWeight,
  NonPositiveCap,
  NonPositiveMaxHours,
  NegativeDeviationLimit,
  NonPositiveEpsilon,
  WeightBudget,
  MalformedConfig,
};

struct ConfigCheck {
  bool ok{false};
  ConfigError reason{ConfigError::MalformedConfig};
  std::optional<SignalId> signal{};
};

constexpr double kWeightBudget = 100.0;

ScoringConfig default_scoring_config();

const char* kind_name(SignalKind k);
std::optional<SignalKind> kind_from_name(const std::string& name);
const char* config_error_name(ConfigError e);

bool kind_allowed(SignalId id, SignalKind kind);
double total_weight(const ScoringConfig& cfg);
ConfigCheck check_config(const ScoringConfig& cfg);

} // namespace trust
