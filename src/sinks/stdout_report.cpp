#include "sinks/stdout_report.hpp"

#include <cinttypes>
#include <cstdio>

#include "core/timestamp.hpp"

namespace capacity_planner::sinks {

bool StdoutReportSink::publish(const core::NodeReport& report) {
  if (out_ == nullptr) {
    return false;
  }

  if (report.failed) {
    std::fprintf(out_, "[node] %s FAILED: %s\n", report.node.c_str(), report.failure.c_str());
    return std::fflush(out_) == 0;
  }

  const auto& analysis = report.analysis;
  std::fprintf(out_, "[node] %s samples=%zu excluded=%zu", report.node.c_str(), analysis.sample_count,
               analysis.excluded.total());
  if (report.risk.has_value()) {
    std::fprintf(out_, " risk=%s cpu=%s memory=%s disk=%s%s", model::to_string(report.risk->overall),
                 model::to_string(report.risk->level(model::Resource::CPU)),
                 model::to_string(report.risk->level(model::Resource::MEMORY)),
                 model::to_string(report.risk->level(model::Resource::DISK)),
                 report.risk->has_data_quality_warning() ? " data_quality_warning" : "");
  }
  std::fprintf(out_, "\n");

  if (analysis.insufficient_data) {
    std::fprintf(out_, "  insufficient data for statistics\n");
  }

  for (const auto resource : model::kResources) {
    const auto& entry = analysis.resource(resource);
    if (entry.has_value()) {
      std::fprintf(out_, "  %-6s mean=%.1f%% stddev=%.2f min=%.1f%% max=%.1f%% trend=%+.3f/h usage=%s %s\n",
                   model::to_string(resource), entry->statistics.mean, entry->statistics.stddev,
                   entry->statistics.min, entry->statistics.max, entry->statistics.trend_per_hour,
                   model::to_string(entry->risk), model::to_string(entry->direction));
    }

    const auto& anomaly = report.anomalies.metric(resource);
    if (anomaly.anomalous()) {
      std::fprintf(out_, "  %-6s anomaly value=%.1f%% expected=[%.1f, %.1f]\n", model::to_string(resource),
                   anomaly.value, anomaly.expected_low, anomaly.expected_high);
    }

    const auto& outcome = report.forecast(resource);
    if (outcome.run.has_value() && !outcome.run->points.empty()) {
      const auto& last = outcome.run->points.back();
      std::fprintf(out_, "  %-6s forecast %s +%zu steps %.1f%% [%.1f, %.1f] at %s\n", model::to_string(resource),
                   model::to_string(outcome.run->model), last.step, last.forecast, last.lower_bound,
                   last.upper_bound, core::format_iso8601(last.timestamp_ms).c_str());
    } else {
      std::fprintf(out_, "  %-6s forecast unavailable: %s\n", model::to_string(resource),
                   outcome.unavailable_reason.c_str());
    }

    if (outcome.backtest.has_value()) {
      const auto& accuracy = outcome.backtest->accuracy;
      std::fprintf(out_, "  %-6s backtest holdout=%zu mae=%.3f rmse=%.3f", model::to_string(resource),
                   outcome.backtest->holdout, accuracy.mae, accuracy.rmse);
      if (accuracy.mape.has_value()) {
        std::fprintf(out_, " mape=%.2f%%", *accuracy.mape);
      }
      std::fprintf(out_, "\n");
    }
  }

  for (const auto& recommendation : report.recommendations) {
    std::fprintf(out_, "  [%s] %s\n", model::to_string(recommendation.severity), recommendation.message.c_str());
  }
  for (const auto& advice : analysis.recommendations) {
    std::fprintf(out_, "  advice: %s\n", advice.c_str());
  }

  return std::fflush(out_) == 0;
}

bool StdoutReportSink::publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) {
  if (out_ == nullptr) {
    return false;
  }

  std::fprintf(out_,
               "[cluster] nodes=%zu with_data=%zu at_risk=%zu worst=%s vcpus=%" PRIu64 "/%" PRIu64
               " (%.1f%%) memory=%.0f/%.0fMB (%.1f%%) disk=%.0f/%.0fGB (%.1f%%) instances=%" PRIu64 "\n",
               summary.nodes, summary.nodes_with_data, summary.nodes_at_risk, model::to_string(summary.worst_risk),
               summary.vcpus_used, summary.vcpus_total, summary.utilization[model::index_of(model::Resource::CPU)],
               summary.memory_used_mb, summary.memory_total_mb,
               summary.utilization[model::index_of(model::Resource::MEMORY)], summary.disk_used_gb,
               summary.disk_total_gb, summary.utilization[model::index_of(model::Resource::DISK)], summary.instances);
  std::fprintf(out_, "[cluster] recommendations critical=%zu high=%zu medium=%zu failed=%zu%s\n",
               stats.recommendations[static_cast<std::size_t>(model::Severity::CRITICAL)],
               stats.recommendations[static_cast<std::size_t>(model::Severity::HIGH)],
               stats.recommendations[static_cast<std::size_t>(model::Severity::MEDIUM)], stats.nodes_failed,
               stats.cancelled ? " (cancelled)" : "");
  return std::fflush(out_) == 0;
}

}  // namespace capacity_planner::sinks
