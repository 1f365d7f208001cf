#pragma once

#include <optional>

#include "model/levels.hpp"
#include "model/metric_sample.hpp"

namespace capacity_planner::risk {

struct ResourceThresholds {
  double warning_pct{60.0};
  double critical_pct{80.0};
};

struct RiskThresholds {
  ResourceThresholds cpu{};
  ResourceThresholds memory{};
  ResourceThresholds disk{};

  const ResourceThresholds& for_resource(model::Resource resource) const noexcept;
};

// Throws core::InvalidConfiguration unless 0 <= warning < critical <= 100 for every resource.
void validate(const RiskThresholds& thresholds);

// Latest utilization of one node. An empty field is missing input, not zero.
struct UtilizationReading {
  model::PerResource<std::optional<double>> utilization{};
  model::PerResource<bool> zero_total{};
};

UtilizationReading reading_from(const model::MetricSample& sample);

struct RiskAssessment {
  model::PerResource<model::RiskLevel> per_resource{};
  model::RiskLevel overall{model::RiskLevel::HEALTHY};
  model::PerResource<double> utilization{};
  // Reported next to the risk, never folded into it.
  model::PerResource<bool> data_quality_warning{};

  model::RiskLevel level(model::Resource resource) const noexcept {
    return per_resource[model::index_of(resource)];
  }
  bool has_data_quality_warning() const noexcept;
};

class RiskClassifier {
 public:
  explicit RiskClassifier(RiskThresholds thresholds = {});

  static model::RiskLevel classify(double value, const ResourceThresholds& thresholds) noexcept;
  static model::UsageRisk classify_usage(double value, const ResourceThresholds& thresholds) noexcept;

  model::RiskLevel classify(model::Resource resource, double value) const noexcept;
  model::UsageRisk classify_usage(model::Resource resource, double mean_value) const noexcept;

  // Throws core::MissingData when any utilization is absent or not finite.
  RiskAssessment assess(const UtilizationReading& reading) const;
  RiskAssessment assess(const model::MetricSample& latest) const;

  const RiskThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  RiskThresholds thresholds_;
};

}  // namespace capacity_planner::risk
