#pragma once
#include <optional>
#include <vector>
#include "Common.h"
#include "DecisionHook.h"
#include "Metrics.h"
#include "SignalSpec.h"
#include "TrustScorer.h"

namespace trust {

struct AuthGateConfig {
  ScoringConfig scoring{default_scoring_config()};
  int threshold{60};
  int low_risk_margin{20};
  double weak_signal_ratio{0.5};
};

struct AuthDecision {
  Verdict verdict{Verdict::Deny};
  InputError error{InputError::None};
  std::optional<SignalId> signal{};
  RiskLevel risk{RiskLevel::High};
  int trust_score{0};
  int threshold{0};
  ScoreResult result{};
  std::vector<SignalId> weak_signals{};

  bool accepted() const { return verdict == Verdict::Accept; }
};

// Threshold gate in front of a scorer. Holds no per-user state.
class AuthGate {
 public:
  explicit AuthGate(const AuthGateConfig& cfg, IMetricSink* metrics = nullptr,
                    IDecisionHook* hook = nullptr);
  // Default sink and hook point into the object itself.
  AuthGate(const AuthGate&) = delete;
  AuthGate& operator=(const AuthGate&) = delete;

  AuthDecision evaluate(const BehaviorSample& sample, const BaselineProfile& baseline) const;
  AuthDecision evaluate(const ITrustScorer& scorer, const BehaviorSample& sample,
                        const BaselineProfile& baseline) const;

  const AuthGateConfig& config() const { return cfg_; }

 private:
  AuthDecision decide(const ScoreOutcome& outcome) const;

  AuthGateConfig cfg_{};
  RuleBasedScorer scorer_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopDecisionHook noop_hook_{};
  IDecisionHook* hook_{nullptr};
};

RiskLevel classify_risk(int trust_score, int threshold, int low_risk_margin);

} // namespace trust
