#include "core/node_report.hpp"

#include <algorithm>

namespace capacity_planner::core {
namespace {

double percent(const double used, const double total) noexcept {
  return total > 0.0 ? (used / total) * 100.0 : 0.0;
}

}  // namespace

ClusterSummary summarize(const std::vector<NodeReport>& reports, const std::int64_t generated_at_ms) {
  ClusterSummary summary{};
  summary.generated_at_ms = generated_at_ms;
  summary.nodes = reports.size();

  for (const auto& report : reports) {
    if (report.risk.has_value()) {
      summary.worst_risk = std::max(summary.worst_risk, report.risk->overall);
      if (report.risk->overall != model::RiskLevel::HEALTHY) {
        ++summary.nodes_at_risk;
      }
    }

    if (!report.latest.has_value()) {
      continue;
    }
    const auto& latest = *report.latest;
    ++summary.nodes_with_data;
    summary.vcpus_used += latest.vcpus_used();
    summary.vcpus_total += latest.vcpus_total();
    summary.memory_used_mb += latest.memory_used_mb();
    summary.memory_total_mb += latest.memory_total_mb();
    summary.disk_used_gb += latest.disk_used_gb();
    summary.disk_total_gb += latest.disk_total_gb();
    summary.instances += latest.instances();
  }

  summary.utilization[model::index_of(model::Resource::CPU)] =
      percent(static_cast<double>(summary.vcpus_used), static_cast<double>(summary.vcpus_total));
  summary.utilization[model::index_of(model::Resource::MEMORY)] =
      percent(summary.memory_used_mb, summary.memory_total_mb);
  summary.utilization[model::index_of(model::Resource::DISK)] = percent(summary.disk_used_gb, summary.disk_total_gb);
  return summary;
}

}  // namespace capacity_planner::core
