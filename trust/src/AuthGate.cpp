#include "trust/AuthGate.h"

namespace trust {

AuthGate::AuthGate(const AuthGateConfig& cfg, IMetricSink* metrics, IDecisionHook* hook)
    : cfg_(cfg),
      scorer_(cfg.scoring),
      metrics_(metrics ? metrics : &noop_),
      hook_(hook ? hook : &noop_hook_) {}

RiskLevel classify_risk(int trust_score, int threshold, int low_risk_margin) {
  int gap = trust_score - threshold;
  if (gap > low_risk_margin) return RiskLevel::Low;
  if (gap >= 0) return RiskLevel::Medium;
  return RiskLevel::High;
}

AuthDecision AuthGate::evaluate(const BehaviorSample& sample,
                                const BaselineProfile& baseline) const {
  return decide(scorer_.score(sample, baseline));
}

AuthDecision AuthGate::evaluate(const ITrustScorer& scorer, const BehaviorSample& sample,
                                const BaselineProfile& baseline) const {
  return decide(scorer.score(sample, baseline));
}

AuthDecision AuthGate::decide(const ScoreOutcome& outcome) const {
  AuthDecision d{};
  d.threshold = cfg_.threshold;

  if (!outcome.ok) {
    d.verdict = Verdict::Invalid;
    d.error = outcome.error;
    d.signal = outcome.signal;
    d.risk = RiskLevel::High;
    metrics_->inc_counter(metric::kInvalidInputTotal, 1,
                          { {"reason", input_error_name(outcome.error)} });
    hook_->on_decision(d);
    return d;
  }

  d.result = outcome.result;
  d.trust_score = outcome.result.total;
  d.verdict = d.trust_score >= cfg_.threshold ? Verdict::Accept : Verdict::Deny;
  d.risk = classify_risk(d.trust_score, cfg_.threshold, cfg_.low_risk_margin);

  for (const auto& spec : cfg_.scoring.signals) {
    auto it = d.result.sub_scores.find(signal_name(spec.id));
    if (it == d.result.sub_scores.end()) continue;
    if (it->second < spec.weight * cfg_.weak_signal_ratio) d.weak_signals.push_back(spec.id);
  }

  for (const auto& flag : d.result.matched_flags) {
    if (!flag.second) {
      metrics_->inc_counter(metric::kSignalMissTotal, 1, { {"signal", flag.first} });
    }
  }
  metrics_->observe_histogram(metric::kScoreHistogram, static_cast<double>(d.trust_score));
  metrics_->inc_counter(metric::kDecisionTotal, 1, { {"verdict", verdict_name(d.verdict)} });
  hook_->on_decision(d);
  return d;
}

} // namespace trust
