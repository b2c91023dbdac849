#pragma once
#include <optional>
#include <string>
#include "Common.h"
#include "SignalSpec.h"

namespace trust {

struct ScoreOutcome {
  bool ok{false};
  InputError error{InputError::MalformedPayload};
  std::optional<SignalId> signal{};
  ScoreResult result{};
};

// Per-kind point functions. Each returns a value in [0, weight].
double score_deviation(double current, double baseline, double weight, double d_max,
                       double epsilon);
double score_hard_cap(double current, double weight, double cap);
double score_binary_match(bool matched, double weight);
double score_circular_proximity(double current_hour, double baseline_hour, double weight,
                                double max_hours);

// Pure and reentrant; reads nothing but its arguments.
ScoreOutcome score(const BehaviorSample& sample, const BaselineProfile& baseline,
                   const ScoringConfig& cfg);

class ITrustScorer {
 public:
  virtual ~ITrustScorer() = default;
  virtual ScoreOutcome score(const BehaviorSample& sample,
                             const BaselineProfile& baseline) const = 0;
  virtual const char* name() const = 0;
};

class RuleBasedScorer final : public ITrustScorer {
 public:
  RuleBasedScorer();
  explicit RuleBasedScorer(const ScoringConfig& cfg);

  ScoreOutcome score(const BehaviorSample& sample,
                     const BaselineProfile& baseline) const override;
  const char* name() const override { return "rule_based"; }
  const ScoringConfig& config() const { return cfg_; }

 private:
  ScoringConfig cfg_{};
};

} // namespace trust
