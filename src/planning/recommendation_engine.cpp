#include "planning/recommendation_engine.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <limits>
#include <utility>

#include "core/timestamp.hpp"

namespace capacity_planner::planning {

namespace {

std::string format(const char* fmt, ...) {
  char buffer[512];
  va_list args;
  va_start(args, fmt);
  const int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  if (written < 0) {
    return {};
  }
  return std::string(buffer, std::min<std::size_t>(static_cast<std::size_t>(written), sizeof(buffer) - 1));
}

std::string crossing_text(const model::Resource resource, const Crossing& crossing) {
  const std::string when = core::format_iso8601(crossing.timestamp_ms);
  return format("%s forecast to reach %s (%.1f%%) in %zu step%s at %s", model::to_string(resource),
                model::to_string(crossing.level), crossing.forecast, crossing.step, crossing.step == 1 ? "" : "s",
                when.c_str());
}

std::size_t crossing_rank(const Recommendation& recommendation) noexcept {
  return recommendation.crossing.has_value() ? recommendation.crossing->step
                                             : std::numeric_limits<std::size_t>::max();
}

std::size_t resource_rank(const Recommendation& recommendation) noexcept {
  return recommendation.resource.has_value() ? model::index_of(*recommendation.resource) : model::kResourceCount;
}

bool ranks_before(const Recommendation& lhs, const Recommendation& rhs) noexcept {
  if (lhs.severity != rhs.severity) {
    return lhs.severity > rhs.severity;
  }
  if (lhs.current_risk != rhs.current_risk) {
    return lhs.current_risk > rhs.current_risk;
  }
  if (crossing_rank(lhs) != crossing_rank(rhs)) {
    return crossing_rank(lhs) < crossing_rank(rhs);
  }
  return resource_rank(lhs) < resource_rank(rhs);
}

}  // namespace

const char* to_string(const Action action) noexcept {
  switch (action) {
    case Action::ADD_CAPACITY:
      return "add_capacity";
    case Action::PLAN_CAPACITY:
      return "plan_capacity";
    case Action::REVIEW_CAPACITY:
      return "review_capacity";
    case Action::INVESTIGATE_ANOMALY:
      return "investigate_anomaly";
    case Action::CONSOLIDATE:
      return "consolidate";
  }
  return "unknown";
}

RecommendationEngine::RecommendationEngine(risk::RiskThresholds thresholds) : classifier_(thresholds) {}

std::optional<Crossing> RecommendationEngine::first_crossing(const model::Resource resource,
                                                             const model::RiskLevel level,
                                                             const std::vector<model::ForecastPoint>& points) const {
  for (const auto& point : points) {
    const model::RiskLevel reached = classifier_.classify(resource, point.forecast);
    if (reached >= level) {
      return Crossing{point.step, point.timestamp_ms, reached, point.forecast};
    }
  }
  return std::nullopt;
}

std::optional<Recommendation> RecommendationEngine::for_resource(
    const std::string& node, const model::Resource resource, const risk::RiskAssessment& risk,
    const risk::AnomalyReport& anomalies, const std::optional<forecast::ForecastRun>& forecast) const {
  const model::RiskLevel current = risk.level(resource);
  const double value = risk.utilization[model::index_of(resource)];
  const auto& limits = classifier_.thresholds().for_resource(resource);
  const risk::MetricAnomaly& anomaly = anomalies.metric(resource);

  std::optional<Crossing> to_critical;
  std::optional<Crossing> to_warning;
  if (forecast.has_value()) {
    if (current < model::RiskLevel::CRITICAL) {
      to_critical = first_crossing(resource, model::RiskLevel::CRITICAL, forecast->points);
    }
    if (current == model::RiskLevel::HEALTHY) {
      to_warning = first_crossing(resource, model::RiskLevel::WARNING, forecast->points);
    }
  }

  Recommendation rec{};
  rec.node = node;
  rec.resource = resource;
  rec.current_risk = current;
  rec.anomalous = anomaly.anomalous();
  rec.crossing = to_warning.has_value() ? to_warning : to_critical;

  if (current == model::RiskLevel::CRITICAL) {
    rec.severity = model::Severity::CRITICAL;
    rec.action = Action::ADD_CAPACITY;
    rec.message = format("%s at %.1f%% is above the critical threshold of %.1f%%: add capacity or migrate instances now",
                         model::to_string(resource), value, limits.critical_pct);
  } else if (to_critical.has_value()) {
    rec.severity = model::Severity::HIGH;
    rec.action = Action::PLAN_CAPACITY;
    rec.message = crossing_text(resource, *to_critical) + ": plan additional capacity";
  } else if (current == model::RiskLevel::WARNING) {
    rec.severity = model::Severity::MEDIUM;
    rec.action = Action::REVIEW_CAPACITY;
    rec.message = format("%s at %.1f%% is above the warning threshold of %.1f%%: review capacity",
                         model::to_string(resource), value, limits.warning_pct);
  } else if (to_warning.has_value()) {
    rec.severity = model::Severity::MEDIUM;
    rec.action = Action::REVIEW_CAPACITY;
    rec.message = crossing_text(resource, *to_warning) + ": review capacity";
  } else if (anomaly.anomalous()) {
    rec.severity = model::Severity::MEDIUM;
    rec.action = Action::INVESTIGATE_ANOMALY;
    rec.message = format("%s at %.1f%% is outside its expected range %.1f%% to %.1f%%: investigate",
                         model::to_string(resource), anomaly.value, anomaly.expected_low, anomaly.expected_high);
    return rec;
  } else {
    return std::nullopt;
  }

  if (anomaly.anomalous()) {
    rec.message += "; latest sample is anomalous";
  }
  return rec;
}

std::optional<Recommendation> RecommendationEngine::consolidation(const model::AnalysisResult& analysis,
                                                                  const risk::RiskAssessment& risk,
                                                                  const risk::AnomalyReport& anomalies) const {
  if (analysis.insufficient_data || risk.overall != model::RiskLevel::HEALTHY || anomalies.any_anomalous()) {
    return std::nullopt;
  }

  double waste = 0.0;
  for (const auto resource : model::kResources) {
    const auto& entry = analysis.resource(resource);
    if (!entry.has_value() || entry->direction != model::ProvisioningDirection::OVER_PROVISIONED ||
        entry->waste <= 0.0 || entry->risk != model::UsageRisk::LOW) {
      return std::nullopt;
    }
    waste += entry->waste;
  }
  waste /= static_cast<double>(model::kResourceCount);

  Recommendation rec{};
  rec.node = analysis.node;
  rec.severity = model::Severity::MEDIUM;
  rec.current_risk = model::RiskLevel::HEALTHY;
  rec.action = Action::CONSOLIDATE;
  rec.message = format("Every resource is below the target band (mean waste %.0f%%): consolidate instances onto "
                       "fewer nodes",
                       waste * 100.0);
  return rec;
}

std::vector<Recommendation> RecommendationEngine::recommend(const model::AnalysisResult& analysis,
                                                            const risk::RiskAssessment& risk,
                                                            const risk::AnomalyReport& anomalies,
                                                            const ForecastSet& forecasts) const {
  std::vector<Recommendation> out;
  for (const auto resource : model::kResources) {
    auto rec = for_resource(analysis.node, resource, risk, anomalies, forecasts[model::index_of(resource)]);
    if (rec.has_value()) {
      out.push_back(std::move(*rec));
    }
  }

  auto node_level = consolidation(analysis, risk, anomalies);
  if (node_level.has_value()) {
    out.push_back(std::move(*node_level));
  }

  std::stable_sort(out.begin(), out.end(), ranks_before);
  return out;
}

}  // namespace capacity_planner::planning
