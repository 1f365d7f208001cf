#include "sinks/json_report.hpp"

#include <cmath>
#include <stdexcept>

#include "core/timestamp.hpp"

namespace capacity_planner::sinks {
namespace {

nlohmann::json number_or_null(const double value) {
  if (!std::isfinite(value)) {
    return nullptr;
  }
  return value;
}

nlohmann::json exclusions_to_json(const model::ExclusionCounts& excluded) {
  return nlohmann::json{{"missing_data", excluded.missing_data},
                        {"data_quality", excluded.data_quality},
                        {"foreign_node", excluded.foreign_node},
                        {"out_of_order", excluded.out_of_order},
                        {"total", excluded.total()}};
}

nlohmann::json analysis_to_json(const model::AnalysisResult& analysis) {
  nlohmann::json metrics = nlohmann::json::object();
  for (const auto resource : model::kResources) {
    const auto& entry = analysis.resource(resource);
    if (!entry.has_value()) {
      metrics[model::metric_name(resource)] = nullptr;
      continue;
    }
    metrics[model::metric_name(resource)] = {{"mean", entry->statistics.mean},
                                             {"variance", entry->statistics.variance},
                                             {"stddev", entry->statistics.stddev},
                                             {"min", entry->statistics.min},
                                             {"max", entry->statistics.max},
                                             {"trend_per_hour", entry->statistics.trend_per_hour},
                                             {"efficiency", entry->efficiency},
                                             {"waste", entry->waste},
                                             {"direction", model::to_string(entry->direction)},
                                             {"risk", model::to_string(entry->risk)}};
  }

  nlohmann::json out{{"sample_count", analysis.sample_count},
                     {"excluded", exclusions_to_json(analysis.excluded)},
                     {"insufficient_data", analysis.insufficient_data},
                     {"metrics", metrics},
                     {"recommendations", analysis.recommendations}};
  out["overall_risk"] = analysis.overall_risk.has_value() ? nlohmann::json(model::to_string(*analysis.overall_risk))
                                                          : nlohmann::json(nullptr);
  out["mean_instances"] =
      analysis.mean_instances.has_value() ? nlohmann::json(*analysis.mean_instances) : nlohmann::json(nullptr);
  if (analysis.sample_count > 0) {
    out["first_sample"] = core::format_iso8601(analysis.window_start_ms);
    out["last_sample"] = core::format_iso8601(analysis.window_end_ms);
  }
  return out;
}

nlohmann::json risk_to_json(const risk::RiskAssessment& assessment) {
  nlohmann::json per_resource = nlohmann::json::object();
  for (const auto resource : model::kResources) {
    const auto index = model::index_of(resource);
    per_resource[model::to_string(resource)] = {{"level", model::to_string(assessment.per_resource[index])},
                                                {"utilization", assessment.utilization[index]},
                                                {"data_quality_warning", assessment.data_quality_warning[index]}};
  }
  return nlohmann::json{{"overall", model::to_string(assessment.overall)}, {"resources", per_resource}};
}

nlohmann::json anomaly_to_json(const risk::MetricAnomaly& anomaly) {
  return nlohmann::json{{"metric", model::metric_name(anomaly.resource)},
                        {"verdict", risk::to_string(anomaly.verdict)},
                        {"value", anomaly.value},
                        {"mean", anomaly.mean},
                        {"stddev", anomaly.stddev},
                        {"deviation", number_or_null(anomaly.deviation)},
                        {"expected_low", anomaly.expected_low},
                        {"expected_high", anomaly.expected_high},
                        {"history_size", anomaly.history_size}};
}

nlohmann::json points_to_json(const std::vector<model::ForecastPoint>& points) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& point : points) {
    out.push_back({{"timestamp", core::format_iso8601(point.timestamp_ms)},
                   {"step", point.step},
                   {"forecast", point.forecast},
                   {"lower_bound", point.lower_bound},
                   {"upper_bound", point.upper_bound},
                   {"confidence", point.confidence},
                   {"model_type", model::to_string(point.model_type)}});
  }
  return out;
}

nlohmann::json outcome_to_json(const core::ForecastOutcome& outcome) {
  nlohmann::json out = nlohmann::json::object();
  if (outcome.run.has_value()) {
    out["forecast"] = points_to_json(outcome.run->points);
    out["model"] = model::to_string(outcome.run->model);
    out["history_size"] = outcome.run->history_size;
    out["outliers_removed"] = outcome.run->outliers_removed;
    out["step_ms"] = outcome.run->step_ms;
    out["fallback_reason"] =
        outcome.run->fallback_reason.has_value() ? nlohmann::json(*outcome.run->fallback_reason) : nlohmann::json(nullptr);
  } else {
    out["forecast"] = nullptr;
    out["unavailable_reason"] = outcome.unavailable_reason;
  }

  if (outcome.backtest.has_value()) {
    const auto& backtest = *outcome.backtest;
    out["backtest"] = {{"model", model::to_string(backtest.model)},
                       {"training_size", backtest.training_size},
                       {"holdout", backtest.holdout},
                       {"mae", backtest.accuracy.mae},
                       {"rmse", backtest.accuracy.rmse},
                       {"mape", backtest.accuracy.mape.has_value() ? nlohmann::json(*backtest.accuracy.mape)
                                                                   : nlohmann::json(nullptr)}};
  } else if (!outcome.backtest_unavailable_reason.empty()) {
    out["backtest"] = nullptr;
    out["backtest_unavailable_reason"] = outcome.backtest_unavailable_reason;
  }
  return out;
}

nlohmann::json recommendation_to_json(const planning::Recommendation& recommendation) {
  nlohmann::json out{{"severity", model::to_string(recommendation.severity)},
                     {"current_risk", model::to_string(recommendation.current_risk)},
                     {"action", planning::to_string(recommendation.action)},
                     {"anomalous", recommendation.anomalous},
                     {"message", recommendation.message}};
  out["resource"] = recommendation.resource.has_value() ? nlohmann::json(model::to_string(*recommendation.resource))
                                                        : nlohmann::json(nullptr);
  if (recommendation.crossing.has_value()) {
    out["crossing"] = {{"step", recommendation.crossing->step},
                       {"timestamp", core::format_iso8601(recommendation.crossing->timestamp_ms)},
                       {"level", model::to_string(recommendation.crossing->level)},
                       {"forecast", recommendation.crossing->forecast}};
  } else {
    out["crossing"] = nullptr;
  }
  return out;
}

}  // namespace

nlohmann::json report_to_json(const core::NodeReport& report) {
  nlohmann::json out{{"type", "node_report"},
                     {"node", report.node},
                     {"generated_at", core::format_iso8601(report.generated_at_ms)},
                     {"window_start", core::format_iso8601(report.window_start_ms)},
                     {"window_end", core::format_iso8601(report.window_end_ms)},
                     {"failed", report.failed},
                     {"analysis", analysis_to_json(report.analysis)},
                     {"exclusion_reasons", report.exclusion_reasons}};
  if (report.failed) {
    out["failure"] = report.failure;
  }

  out["risk"] = report.risk.has_value() ? risk_to_json(*report.risk) : nlohmann::json(nullptr);

  nlohmann::json anomalies = nlohmann::json::array();
  for (const auto& metric : report.anomalies.metrics) {
    anomalies.push_back(anomaly_to_json(metric));
  }
  out["anomalies"] = anomalies;

  nlohmann::json events = nlohmann::json::array();
  for (const auto& event : report.anomaly_events) {
    auto entry = anomaly_to_json(event.detail);
    entry["timestamp"] = core::format_iso8601(event.timestamp_ms);
    events.push_back(entry);
  }
  out["anomaly_events"] = events;

  nlohmann::json forecasts = nlohmann::json::object();
  for (const auto resource : model::kResources) {
    forecasts[model::metric_name(resource)] = outcome_to_json(report.forecast(resource));
  }
  out["forecasts"] = forecasts;

  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto& recommendation : report.recommendations) {
    recommendations.push_back(recommendation_to_json(recommendation));
  }
  out["recommendations"] = recommendations;
  return out;
}

nlohmann::json summary_to_json(const core::ClusterSummary& summary, const core::PassStats& stats) {
  return nlohmann::json{
      {"type", "cluster_summary"},
      {"generated_at", core::format_iso8601(summary.generated_at_ms)},
      {"nodes", summary.nodes},
      {"nodes_with_data", summary.nodes_with_data},
      {"nodes_at_risk", summary.nodes_at_risk},
      {"worst_risk", model::to_string(summary.worst_risk)},
      {"vcpus", {{"used", summary.vcpus_used}, {"total", summary.vcpus_total}}},
      {"memory_mb", {{"used", summary.memory_used_mb}, {"total", summary.memory_total_mb}}},
      {"disk_gb", {{"used", summary.disk_used_gb}, {"total", summary.disk_total_gb}}},
      {"instances", summary.instances},
      {"utilization",
       {{"cpu", summary.utilization[model::index_of(model::Resource::CPU)]},
        {"memory", summary.utilization[model::index_of(model::Resource::MEMORY)]},
        {"disk", summary.utilization[model::index_of(model::Resource::DISK)]}}},
      {"pass",
       {{"nodes_listed", stats.nodes_listed},
        {"nodes_analyzed", stats.nodes_analyzed},
        {"nodes_failed", stats.nodes_failed},
        {"nodes_skipped", stats.nodes_skipped},
        {"anomalies", stats.anomalies},
        {"cancelled", stats.cancelled},
        {"recommendations",
         {{"Critical", stats.recommendations[static_cast<std::size_t>(model::Severity::CRITICAL)]},
          {"High", stats.recommendations[static_cast<std::size_t>(model::Severity::HIGH)]},
          {"Medium", stats.recommendations[static_cast<std::size_t>(model::Severity::MEDIUM)]}}}}}};
}

JsonReportSink::JsonReportSink(const std::string& path) : file_(path, std::ios::app), out_(&file_) {
  if (!file_.is_open()) {
    throw std::runtime_error("unable to open report file: " + path);
  }
}

JsonReportSink::JsonReportSink(std::ostream& out) : out_(&out) {}

bool JsonReportSink::write_line(const nlohmann::json& document) {
  *out_ << document.dump() << '\n';
  out_->flush();
  return out_->good();
}

bool JsonReportSink::publish(const core::NodeReport& report) { return write_line(report_to_json(report)); }

bool JsonReportSink::publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) {
  return write_line(summary_to_json(summary, stats));
}

}  // namespace capacity_planner::sinks
