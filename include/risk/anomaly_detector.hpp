#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "model/levels.hpp"
#include "model/metric_sample.hpp"

namespace capacity_planner::risk {

struct AnomalyOptions {
  double k_sigma{3.0};
  // History samples required before a verdict is given.
  std::size_t min_history{20};
  // Trailing samples considered; 0 means the whole history.
  std::size_t window{24};
  // Tolerance used when the history is constant.
  double epsilon{1e-9};
};

void validate(const AnomalyOptions& options);

enum class AnomalyVerdict : std::uint8_t {
  NORMAL = 0,
  ANOMALOUS = 1,
  INDETERMINATE = 2,
};

const char* to_string(AnomalyVerdict verdict) noexcept;

struct MetricAnomaly {
  model::Resource resource{model::Resource::CPU};
  AnomalyVerdict verdict{AnomalyVerdict::INDETERMINATE};
  double value{0.0};
  double mean{0.0};
  double stddev{0.0};
  // |value - mean| / stddev; infinite when the history is constant and value differs.
  double deviation{0.0};
  double expected_low{0.0};
  double expected_high{0.0};
  std::size_t history_size{0};

  bool anomalous() const noexcept { return verdict == AnomalyVerdict::ANOMALOUS; }
};

struct AnomalyReport {
  model::PerResource<MetricAnomaly> metrics{};

  const MetricAnomaly& metric(model::Resource resource) const noexcept { return metrics[model::index_of(resource)]; }
  bool any_anomalous() const noexcept;
  bool indeterminate() const noexcept;
};

struct AnomalyEvent {
  std::int64_t timestamp_ms{0};
  MetricAnomaly detail{};
};

class AnomalyDetector {
 public:
  explicit AnomalyDetector(AnomalyOptions options = {});

  MetricAnomaly evaluate(model::Resource resource, const std::vector<double>& history, double newest) const;

  // The last sample is the newest; everything before it is history.
  AnomalyReport evaluate(const std::vector<model::MetricSample>& window) const;

  // Every sample judged against its own trailing history, oldest first.
  std::vector<AnomalyEvent> scan(const std::vector<model::MetricSample>& window) const;

  const AnomalyOptions& options() const noexcept { return options_; }

 private:
  MetricAnomaly evaluate_range(model::Resource resource, const std::vector<double>& series, std::size_t newest_index) const;

  AnomalyOptions options_;
};

}  // namespace capacity_planner::risk
