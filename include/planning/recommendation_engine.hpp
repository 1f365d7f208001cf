#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "forecast/forecaster.hpp"
#include "model/analysis_result.hpp"
#include "model/levels.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/risk_classifier.hpp"

namespace capacity_planner::planning {

enum class Action : std::uint8_t {
  ADD_CAPACITY = 0,
  PLAN_CAPACITY = 1,
  REVIEW_CAPACITY = 2,
  INVESTIGATE_ANOMALY = 3,
  CONSOLIDATE = 4,
};

const char* to_string(Action action) noexcept;

struct Crossing {
  std::size_t step{0};
  std::int64_t timestamp_ms{0};
  model::RiskLevel level{model::RiskLevel::WARNING};
  double forecast{0.0};
};

struct Recommendation {
  std::string node{};
  // Empty for node-level advice.
  std::optional<model::Resource> resource{};
  model::Severity severity{model::Severity::MEDIUM};
  model::RiskLevel current_risk{model::RiskLevel::HEALTHY};
  std::optional<Crossing> crossing{};
  bool anomalous{false};
  Action action{Action::REVIEW_CAPACITY};
  std::string message{};
};

using ForecastSet = model::PerResource<std::optional<forecast::ForecastRun>>;

class RecommendationEngine {
 public:
  explicit RecommendationEngine(risk::RiskThresholds thresholds = {});

  // Ranked by severity, current risk, earliest crossing, then cpu/memory/disk.
  std::vector<Recommendation> recommend(const model::AnalysisResult& analysis, const risk::RiskAssessment& risk,
                                        const risk::AnomalyReport& anomalies, const ForecastSet& forecasts) const;

  // First point whose estimate classifies at or above `level`.
  std::optional<Crossing> first_crossing(model::Resource resource, model::RiskLevel level,
                                         const std::vector<model::ForecastPoint>& points) const;

 private:
  std::optional<Recommendation> for_resource(const std::string& node, model::Resource resource,
                                             const risk::RiskAssessment& risk, const risk::AnomalyReport& anomalies,
                                             const std::optional<forecast::ForecastRun>& forecast) const;
  std::optional<Recommendation> consolidation(const model::AnalysisResult& analysis, const risk::RiskAssessment& risk,
                                              const risk::AnomalyReport& anomalies) const;

  risk::RiskClassifier classifier_;
};

}  // namespace capacity_planner::planning
