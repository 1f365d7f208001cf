#include "core/sample_window.hpp"

#include <utility>

#include "core/errors.hpp"

namespace capacity_planner::core {

namespace {

// Only the first reasons are kept; counts stay exact.
constexpr std::size_t kMaxExclusionReasons = 16;

void note_reason(SampleWindow& window, const std::string& reason) {
  if (window.exclusion_reasons.size() < kMaxExclusionReasons) {
    window.exclusion_reasons.push_back(reason);
  }
}

}  // namespace

SampleWindow build_sample_window(const std::string& node, const std::vector<model::RawSample>& raw) {
  SampleWindow window{};
  window.node = node;
  window.samples.reserve(raw.size());

  for (const auto& candidate : raw) {
    try {
      model::MetricSample sample(candidate);
      if (sample.node() != node) {
        ++window.excluded.foreign_node;
        note_reason(window, "sample belongs to node " + sample.node());
        continue;
      }
      if (!window.samples.empty() && sample.timestamp_ms() <= window.samples.back().timestamp_ms()) {
        ++window.excluded.out_of_order;
        note_reason(window, sample.timestamp_ms() == window.samples.back().timestamp_ms()
                                ? "duplicate timestamp " + std::to_string(sample.timestamp_ms())
                                : "non-monotonic timestamp " + std::to_string(sample.timestamp_ms()));
        continue;
      }
      window.samples.push_back(std::move(sample));
    } catch (const MissingData& ex) {
      ++window.excluded.missing_data;
      note_reason(window, ex.what());
    } catch (const DataQualityError& ex) {
      ++window.excluded.data_quality;
      note_reason(window, ex.what());
    }
  }

  if (!raw.empty() && window.samples.empty()) {
    throw InsufficientHistory("every sample in the window for " + node + " was invalid", 0, 1);
  }

  return window;
}

std::vector<double> utilization_series(const SampleWindow& window, const model::Resource resource) {
  std::vector<double> values;
  values.reserve(window.samples.size());
  for (const auto& sample : window.samples) {
    values.push_back(sample.utilization(resource));
  }
  return values;
}

}  // namespace capacity_planner::core
