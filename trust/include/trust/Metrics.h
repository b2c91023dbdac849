#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace trust {

namespace metric {
constexpr std::string_view kDecisionTotal = "trust_decision_total";         // {verdict}
constexpr std::string_view kInvalidInputTotal = "trust_invalid_input_total"; // {reason}
constexpr std::string_view kSignalMissTotal = "trust_signal_miss_total";     // {signal}
constexpr std::string_view kScoreHistogram = "trust_score_histogram";
} // namespace metric

struct MetricLabel {
  std::string key;
  std::string value;
};

class IMetricSink {
 public:
  virtual ~IMetricSink() = default;
  virtual void inc_counter(std::string_view name, uint64_t value = 1,
                           const std::vector<MetricLabel>& labels = {}) = 0;
  virtual void observe_histogram(std::string_view name, double value,
                                 const std::vector<MetricLabel>& labels = {}) = 0;
};

class NoopMetricSink final : public IMetricSink {
 public:
  void inc_counter(std::string_view, uint64_t, const std::vector<MetricLabel>&) override {}
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}
};

} // namespace trust
