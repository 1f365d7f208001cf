#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "forecast/forecaster.hpp"
#include "model/analysis_result.hpp"
#include "model/levels.hpp"
#include "model/metric_sample.hpp"
#include "planning/recommendation_engine.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/risk_classifier.hpp"

namespace capacity_planner::core {

// Either a run or the reason there is none. A backtest is reported on its own.
struct ForecastOutcome {
  std::optional<forecast::ForecastRun> run{};
  std::string unavailable_reason{};
  std::optional<forecast::BacktestResult> backtest{};
  std::string backtest_unavailable_reason{};
};

struct NodeReport {
  std::string node{};
  std::int64_t generated_at_ms{0};
  std::int64_t window_start_ms{0};
  std::int64_t window_end_ms{0};

  // Set when the node could not be analyzed at all; everything below is then partial.
  bool failed{false};
  std::string failure{};

  model::AnalysisResult analysis{};
  std::vector<std::string> exclusion_reasons{};
  std::optional<model::MetricSample> latest{};
  std::optional<risk::RiskAssessment> risk{};
  risk::AnomalyReport anomalies{};
  std::vector<risk::AnomalyEvent> anomaly_events{};
  model::PerResource<ForecastOutcome> forecasts{};
  std::vector<planning::Recommendation> recommendations{};

  const ForecastOutcome& forecast(model::Resource resource) const noexcept {
    return forecasts[model::index_of(resource)];
  }
};

// Capacity of the cluster from the latest sample of every analyzed node.
struct ClusterSummary {
  std::int64_t generated_at_ms{0};
  std::size_t nodes{0};
  std::size_t nodes_with_data{0};
  std::size_t nodes_at_risk{0};
  std::uint64_t vcpus_used{0};
  std::uint64_t vcpus_total{0};
  double memory_used_mb{0.0};
  double memory_total_mb{0.0};
  double disk_used_gb{0.0};
  double disk_total_gb{0.0};
  std::uint64_t instances{0};
  model::PerResource<double> utilization{};
  model::RiskLevel worst_risk{model::RiskLevel::HEALTHY};
};

ClusterSummary summarize(const std::vector<NodeReport>& reports, std::int64_t generated_at_ms);

struct PassStats {
  std::size_t nodes_listed{0};
  std::size_t nodes_analyzed{0};
  std::size_t nodes_failed{0};
  std::size_t nodes_skipped{0};
  std::size_t anomalies{0};
  // Indexed by model::Severity.
  std::array<std::size_t, 3> recommendations{};
  bool cancelled{false};
};

}  // namespace capacity_planner::core
