#pragma once

#include <optional>
#include <string>

#include "core/sample_window.hpp"
#include "model/analysis_result.hpp"
#include "risk/risk_classifier.hpp"

namespace capacity_planner::derived {

struct EfficiencyBand {
  double target_low_pct{40.0};
  double target_high_pct{60.0};
  // Below this mean a node is considered idle.
  double underutilized_pct{20.0};
};

void validate(const EfficiencyBand& band);

struct AdviceKey {
  model::Resource resource{model::Resource::CPU};
  model::ProvisioningDirection direction{model::ProvisioningDirection::BALANCED};
  model::Severity severity{model::Severity::MEDIUM};
};

inline constexpr const char* kBalancedAdvice = "Node capacity is well-balanced";

class UtilizationAnalyzer {
 public:
  UtilizationAnalyzer(EfficiencyBand band, const risk::RiskThresholds& thresholds);

  // Never throws on thin data: fewer than two samples yields an insufficient_data result.
  model::AnalysisResult analyze(const core::SampleWindow& window) const;

  // Advice for one resource, or nullopt when it sits inside the band.
  std::optional<AdviceKey> advise(model::Resource resource, const model::ResourceAnalysis& analysis) const noexcept;

  std::string render(const AdviceKey& key, const model::ResourceAnalysis& analysis) const;

 private:
  model::ResourceAnalysis analyze_resource(model::Resource resource, const core::SampleWindow& window) const;

  EfficiencyBand band_;
  risk::RiskClassifier classifier_;
};

}  // namespace capacity_planner::derived
