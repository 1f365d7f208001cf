#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/levels.hpp"
#include "model/metric_sample.hpp"

namespace capacity_planner::model {

struct MetricStatistics {
  double mean{0.0};
  double variance{0.0};
  double stddev{0.0};
  double min{0.0};
  double max{0.0};
  // Least-squares slope, percentage points per hour.
  double trend_per_hour{0.0};
};

enum class ProvisioningDirection : std::uint8_t {
  // Mean above the target band: the node needs more capacity.
  UNDER_PROVISIONED = 0,
  BALANCED = 1,
  // Mean below the target band: capacity sits idle.
  OVER_PROVISIONED = 2,
};

const char* to_string(ProvisioningDirection direction) noexcept;

struct ResourceAnalysis {
  MetricStatistics statistics{};
  // Mean relative to the target band, in [0, 1].
  double efficiency{1.0};
  // 1 - efficiency while over-provisioned, otherwise 0.
  double waste{0.0};
  ProvisioningDirection direction{ProvisioningDirection::BALANCED};
  UsageRisk risk{UsageRisk::LOW};
};

// Summary of one node over one window. Built once per run and never mutated.
struct AnalysisResult {
  std::string node{};
  std::int64_t window_start_ms{0};
  std::int64_t window_end_ms{0};
  std::size_t sample_count{0};
  ExclusionCounts excluded{};

  // Fewer than two usable samples; every optional below is then empty.
  bool insufficient_data{true};
  PerResource<std::optional<ResourceAnalysis>> resources{};
  std::optional<UsageRisk> overall_risk{};
  std::optional<double> mean_instances{};

  std::vector<std::string> recommendations{};

  const std::optional<ResourceAnalysis>& resource(Resource r) const noexcept { return resources[index_of(r)]; }
};

}  // namespace capacity_planner::model
