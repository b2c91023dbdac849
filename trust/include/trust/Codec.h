#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "AuthGate.h"
#include "Common.h"
#include "SignalSpec.h"

namespace trust {

struct SampleParse {
  bool ok{false};
  InputError error{InputError::MalformedPayload};
  std::string field{};
  BehaviorSample sample{};
};

struct BaselineParse {
  bool ok{false};
  InputError error{InputError::MalformedPayload};
  std::string field{};
  BaselineProfile baseline{};
};

struct ConfigParse {
  bool ok{false};
  ConfigError error{ConfigError::MalformedConfig};
  std::string detail{};
  ScoringConfig config{};
};

struct GateConfigParse {
  bool ok{false};
  ConfigError error{ConfigError::MalformedConfig};
  std::string detail{};
  AuthGateConfig config{};
};

// Behavior payload: all nine fields required, time_of_day an integer.
SampleParse parse_sample(const nlohmann::json& j);
SampleParse parse_sample(const std::string& text);

// Baseline: every field optional; null is the same as absent.
BaselineParse parse_baseline(const nlohmann::json& j);

// Missing keys keep defaults. The result must pass check_config.
ConfigParse parse_scoring_config(const nlohmann::json& j);
GateConfigParse parse_gate_config(const nlohmann::json& j);
GateConfigParse parse_gate_config(const std::string& text);

// One trust_eval request line: {"behavior": {...}, "baseline": {...}}. Always
// yields a response object; malformed lines become error responses.
nlohmann::json handle_eval_request(const AuthGate& gate, const std::string& line);

nlohmann::json to_json(const ScoreResult& r);
nlohmann::json to_json(const AuthDecision& d);
nlohmann::json to_json(const ScoringConfig& cfg);

} // namespace trust
