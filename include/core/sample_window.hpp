#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "model/metric_sample.hpp"

namespace capacity_planner::core {

// Validated, strictly ascending samples of a single node plus a record of what was dropped.
struct SampleWindow {
  std::string node{};
  std::vector<model::MetricSample> samples{};
  model::ExclusionCounts excluded{};
  std::vector<std::string> exclusion_reasons{};

  bool empty() const noexcept { return samples.empty(); }
  std::size_t size() const noexcept { return samples.size(); }
  const model::MetricSample& latest() const { return samples.back(); }
};

// Validates every raw sample. Invalid samples are excluded and counted; a sample whose
// timestamp does not advance past the previous accepted one is excluded as out of order.
// Throws InsufficientHistory when raw is non-empty and no sample survives.
SampleWindow build_sample_window(const std::string& node, const std::vector<model::RawSample>& raw);

// Utilization series of one resource, in window order.
std::vector<double> utilization_series(const SampleWindow& window, model::Resource resource);

}  // namespace capacity_planner::core
