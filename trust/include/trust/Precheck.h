#pragma once
#include <optional>
#include "Common.h"
#include "SignalSpec.h"

namespace trust {

struct InputCheck {
  bool ok{false};
  InputError reason{InputError::MalformedPayload};
  std::optional<SignalId> signal{};
};

// Structural checks only; extreme but well-formed behavior passes.
InputCheck check_sample(const BehaviorSample& sample);

// Baseline fields needed by a configured deviation or circular signal must be
// present. Any present numeric must be finite and non-negative.
InputCheck check_baseline(const BaselineProfile& baseline, const ScoringConfig& cfg);

} // namespace trust
