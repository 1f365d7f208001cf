#include "risk/risk_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/errors.hpp"

namespace capacity_planner::risk {

namespace {

void validate_resource(const ResourceThresholds& thresholds, const char* name) {
  const std::string prefix(name);
  if (!std::isfinite(thresholds.warning_pct) || !std::isfinite(thresholds.critical_pct)) {
    throw core::InvalidConfiguration(prefix + " thresholds must be finite");
  }
  if (thresholds.warning_pct < 0.0 || thresholds.critical_pct > 100.0) {
    throw core::InvalidConfiguration(prefix + " thresholds must lie within 0..100");
  }
  if (thresholds.warning_pct >= thresholds.critical_pct) {
    throw core::InvalidConfiguration(prefix + "_warning_pct must be lower than " + prefix + "_critical_pct");
  }
}

}  // namespace

const ResourceThresholds& RiskThresholds::for_resource(const model::Resource resource) const noexcept {
  switch (resource) {
    case model::Resource::CPU:
      return cpu;
    case model::Resource::MEMORY:
      return memory;
    case model::Resource::DISK:
      return disk;
  }
  return cpu;
}

void validate(const RiskThresholds& thresholds) {
  validate_resource(thresholds.cpu, "cpu");
  validate_resource(thresholds.memory, "memory");
  validate_resource(thresholds.disk, "disk");
}

UtilizationReading reading_from(const model::MetricSample& sample) {
  UtilizationReading reading{};
  for (const auto resource : model::kResources) {
    reading.utilization[model::index_of(resource)] = sample.utilization(resource);
    reading.zero_total[model::index_of(resource)] = sample.zero_total(resource);
  }
  return reading;
}

bool RiskAssessment::has_data_quality_warning() const noexcept {
  return std::any_of(data_quality_warning.begin(), data_quality_warning.end(), [](bool flag) { return flag; });
}

RiskClassifier::RiskClassifier(RiskThresholds thresholds) : thresholds_(thresholds) {
  validate(thresholds_);
}

model::RiskLevel RiskClassifier::classify(const double value, const ResourceThresholds& thresholds) noexcept {
  if (value > thresholds.critical_pct) {
    return model::RiskLevel::CRITICAL;
  }
  if (value > thresholds.warning_pct) {
    return model::RiskLevel::WARNING;
  }
  return model::RiskLevel::HEALTHY;
}

model::UsageRisk RiskClassifier::classify_usage(const double value, const ResourceThresholds& thresholds) noexcept {
  switch (classify(value, thresholds)) {
    case model::RiskLevel::CRITICAL:
      return model::UsageRisk::HIGH;
    case model::RiskLevel::WARNING:
      return model::UsageRisk::MEDIUM;
    case model::RiskLevel::HEALTHY:
      break;
  }
  return model::UsageRisk::LOW;
}

model::RiskLevel RiskClassifier::classify(const model::Resource resource, const double value) const noexcept {
  return classify(value, thresholds_.for_resource(resource));
}

model::UsageRisk RiskClassifier::classify_usage(const model::Resource resource, const double mean_value) const noexcept {
  return classify_usage(mean_value, thresholds_.for_resource(resource));
}

RiskAssessment RiskClassifier::assess(const UtilizationReading& reading) const {
  RiskAssessment assessment{};

  for (const auto resource : model::kResources) {
    const std::size_t i = model::index_of(resource);
    const auto& value = reading.utilization[i];
    if (!value.has_value() || !std::isfinite(*value)) {
      throw core::MissingData(std::string("utilization reading is missing ") + model::metric_name(resource));
    }

    assessment.utilization[i] = *value;
    assessment.per_resource[i] = classify(resource, *value);
    assessment.data_quality_warning[i] = reading.zero_total[i];
    assessment.overall = std::max(assessment.overall, assessment.per_resource[i]);
  }

  return assessment;
}

RiskAssessment RiskClassifier::assess(const model::MetricSample& latest) const {
  return assess(reading_from(latest));
}

}  // namespace capacity_planner::risk
