#include "derived/utilization_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <vector>

#include "core/errors.hpp"
#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace capacity_planner::derived {

namespace {

constexpr std::size_t kMinSamplesForStatistics = 2;

const char* capacity_noun(const model::Resource resource) noexcept {
  switch (resource) {
    case model::Resource::CPU:
      return "CPU capacity";
    case model::Resource::MEMORY:
      return "memory";
    case model::Resource::DISK:
      return "disk storage";
  }
  return "capacity";
}

const char* metric_label(const model::Resource resource) noexcept {
  switch (resource) {
    case model::Resource::CPU:
      return "CPU";
    case model::Resource::MEMORY:
      return "memory";
    case model::Resource::DISK:
      return "disk";
  }
  return "resource";
}

}  // namespace

void validate(const EfficiencyBand& band) {
  if (!std::isfinite(band.target_low_pct) || !std::isfinite(band.target_high_pct) ||
      !std::isfinite(band.underutilized_pct)) {
    throw core::InvalidConfiguration("analysis target band must be finite");
  }
  if (band.underutilized_pct < 0.0 || band.underutilized_pct >= band.target_low_pct) {
    throw core::InvalidConfiguration("analysis.underutilized_pct must lie within 0..target_low_pct");
  }
  if (band.target_low_pct >= band.target_high_pct || band.target_high_pct > 100.0) {
    throw core::InvalidConfiguration("analysis.target_low_pct must be lower than target_high_pct <= 100");
  }
}

UtilizationAnalyzer::UtilizationAnalyzer(EfficiencyBand band, const risk::RiskThresholds& thresholds)
    : band_(band), classifier_(thresholds) {
  validate(band_);
}

model::AnalysisResult UtilizationAnalyzer::analyze(const core::SampleWindow& window) const {
  model::AnalysisResult result{};
  result.node = window.node;
  result.sample_count = window.size();
  result.excluded = window.excluded;

  if (!window.empty()) {
    result.window_start_ms = window.samples.front().timestamp_ms();
    result.window_end_ms = window.samples.back().timestamp_ms();
  }

  if (window.size() < kMinSamplesForStatistics) {
    result.insufficient_data = true;
    return result;
  }
  result.insufficient_data = false;

  double instances_sum = 0.0;
  for (const auto& sample : window.samples) {
    instances_sum += static_cast<double>(sample.instances());
  }
  result.mean_instances = instances_sum / static_cast<double>(window.size());

  model::UsageRisk overall = model::UsageRisk::LOW;
  for (const auto resource : model::kResources) {
    auto analysis = analyze_resource(resource, window);
    overall = std::max(overall, analysis.risk);

    if (const auto key = advise(resource, analysis); key.has_value()) {
      result.recommendations.push_back(render(*key, analysis));
    }
    result.resources[model::index_of(resource)] = analysis;
  }
  result.overall_risk = overall;

  if (result.recommendations.empty()) {
    result.recommendations.emplace_back(kBalancedAdvice);
  }
  return result;
}

model::ResourceAnalysis UtilizationAnalyzer::analyze_resource(const model::Resource resource,
                                                              const core::SampleWindow& window) const {
  const std::vector<double> values = core::utilization_series(window, resource);

  std::vector<double> hours;
  hours.reserve(window.size());
  const std::int64_t origin = window.samples.front().timestamp_ms();
  for (const auto& sample : window.samples) {
    hours.push_back(static_cast<double>(sample.timestamp_ms() - origin) / static_cast<double>(core::kMillisPerHour));
  }

  model::ResourceAnalysis analysis{};
  auto& stats = analysis.statistics;
  stats.mean = core::mean(values);
  stats.variance = core::sample_variance(values);
  stats.stddev = std::sqrt(stats.variance);
  const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
  stats.min = *min_it;
  stats.max = *max_it;
  stats.trend_per_hour = core::linear_fit(hours, values).slope;

  if (stats.mean > band_.target_high_pct) {
    analysis.direction = model::ProvisioningDirection::UNDER_PROVISIONED;
    analysis.efficiency = band_.target_high_pct / stats.mean;
  } else if (stats.mean < band_.target_low_pct) {
    analysis.direction = model::ProvisioningDirection::OVER_PROVISIONED;
    analysis.efficiency = stats.mean / band_.target_low_pct;
    analysis.waste = 1.0 - analysis.efficiency;
  } else {
    analysis.direction = model::ProvisioningDirection::BALANCED;
    analysis.efficiency = 1.0;
  }

  analysis.risk = classifier_.classify_usage(resource, stats.mean);
  return analysis;
}

std::optional<AdviceKey> UtilizationAnalyzer::advise(const model::Resource resource,
                                                     const model::ResourceAnalysis& analysis) const noexcept {
  const double mean = analysis.statistics.mean;
  switch (analysis.direction) {
    case model::ProvisioningDirection::UNDER_PROVISIONED: {
      model::Severity severity = model::Severity::MEDIUM;
      if (analysis.risk == model::UsageRisk::HIGH) {
        severity = model::Severity::CRITICAL;
      } else if (analysis.risk == model::UsageRisk::MEDIUM) {
        severity = model::Severity::HIGH;
      }
      return AdviceKey{resource, analysis.direction, severity};
    }
    case model::ProvisioningDirection::OVER_PROVISIONED:
      return AdviceKey{resource, analysis.direction,
                       mean < band_.underutilized_pct ? model::Severity::HIGH : model::Severity::MEDIUM};
    case model::ProvisioningDirection::BALANCED:
      break;
  }
  return std::nullopt;
}

std::string UtilizationAnalyzer::render(const AdviceKey& key, const model::ResourceAnalysis& analysis) const {
  const auto& thresholds = classifier_.thresholds().for_resource(key.resource);
  const double mean = analysis.statistics.mean;
  const char* noun = capacity_noun(key.resource);
  const char* label = metric_label(key.resource);

  char buffer[256]{};
  if (key.direction == model::ProvisioningDirection::UNDER_PROVISIONED) {
    switch (key.severity) {
      case model::Severity::CRITICAL:
        std::snprintf(buffer, sizeof(buffer),
                      "Add %s or migrate instances now: mean %s utilization %.1f%% exceeds the %.0f%% critical threshold",
                      noun, label, mean, thresholds.critical_pct);
        break;
      case model::Severity::HIGH:
        std::snprintf(buffer, sizeof(buffer),
                      "Plan additional %s: mean %s utilization %.1f%% exceeds the %.0f%% warning threshold", noun,
                      label, mean, thresholds.warning_pct);
        break;
      case model::Severity::MEDIUM:
        std::snprintf(buffer, sizeof(buffer),
                      "Consider adding %s: mean %s utilization %.1f%% is above the %.0f%% target band", noun, label,
                      mean, band_.target_high_pct);
        break;
    }
    return buffer;
  }

  if (key.direction == model::ProvisioningDirection::OVER_PROVISIONED) {
    if (key.severity == model::Severity::HIGH) {
      std::snprintf(buffer, sizeof(buffer),
                    "Consider consolidating under-utilized node: mean %s utilization %.1f%% is below %.0f%%", label,
                    mean, band_.underutilized_pct);
    } else {
      std::snprintf(buffer, sizeof(buffer),
                    "%s is over-provisioned: mean %s utilization %.1f%% is below the %.0f%% target band", noun, label,
                    mean, band_.target_low_pct);
      buffer[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(buffer[0])));
    }
    return buffer;
  }

  return kBalancedAdvice;
}

}  // namespace capacity_planner::derived
