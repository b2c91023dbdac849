#pragma once
#include "Common.h"

namespace trust {

struct AuthDecision;

class IDecisionHook {
 public:
  virtual ~IDecisionHook() = default;
  virtual void on_decision(const AuthDecision& decision) = 0;
};

class NoopDecisionHook : public IDecisionHook {
 public:
  void on_decision(const AuthDecision&) override {}
};

} // namespace trust
