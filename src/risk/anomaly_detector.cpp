#include "risk/anomaly_detector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace capacity_planner::risk {

void validate(const AnomalyOptions& options) {
  if (!std::isfinite(options.k_sigma) || options.k_sigma <= 0.0) {
    throw core::InvalidConfiguration("anomaly_k_sigma must be greater than 0");
  }
  if (options.min_history < 2) {
    throw core::InvalidConfiguration("anomaly.min_history must be at least 2");
  }
  if (options.window != 0 && options.window < options.min_history) {
    throw core::InvalidConfiguration("anomaly.window must be 0 or at least anomaly.min_history");
  }
  if (!std::isfinite(options.epsilon) || options.epsilon < 0.0) {
    throw core::InvalidConfiguration("anomaly.epsilon must be a non-negative number");
  }
}

const char* to_string(const AnomalyVerdict verdict) noexcept {
  switch (verdict) {
    case AnomalyVerdict::NORMAL:
      return "normal";
    case AnomalyVerdict::ANOMALOUS:
      return "anomalous";
    case AnomalyVerdict::INDETERMINATE:
      return "indeterminate";
  }
  return "unknown";
}

bool AnomalyReport::any_anomalous() const noexcept {
  return std::any_of(metrics.begin(), metrics.end(), [](const MetricAnomaly& m) { return m.anomalous(); });
}

bool AnomalyReport::indeterminate() const noexcept {
  return std::all_of(metrics.begin(), metrics.end(),
                     [](const MetricAnomaly& m) { return m.verdict == AnomalyVerdict::INDETERMINATE; });
}

AnomalyDetector::AnomalyDetector(AnomalyOptions options) : options_(options) {
  validate(options_);
}

MetricAnomaly AnomalyDetector::evaluate(const model::Resource resource, const std::vector<double>& history,
                                        const double newest) const {
  std::vector<double> series(history);
  series.push_back(newest);
  return evaluate_range(resource, series, series.size() - 1);
}

AnomalyReport AnomalyDetector::evaluate(const std::vector<model::MetricSample>& window) const {
  AnomalyReport report{};
  for (const auto resource : model::kResources) {
    auto& metric = report.metrics[model::index_of(resource)];
    metric.resource = resource;
    if (window.empty()) {
      continue;
    }

    std::vector<double> series;
    series.reserve(window.size());
    for (const auto& sample : window) {
      series.push_back(sample.utilization(resource));
    }
    metric = evaluate_range(resource, series, series.size() - 1);
  }
  return report;
}

std::vector<AnomalyEvent> AnomalyDetector::scan(const std::vector<model::MetricSample>& window) const {
  std::vector<AnomalyEvent> events;
  if (window.size() <= options_.min_history) {
    return events;
  }

  for (const auto resource : model::kResources) {
    std::vector<double> series;
    series.reserve(window.size());
    for (const auto& sample : window) {
      series.push_back(sample.utilization(resource));
    }

    for (std::size_t i = options_.min_history; i < series.size(); ++i) {
      const auto detail = evaluate_range(resource, series, i);
      if (detail.anomalous()) {
        events.push_back(AnomalyEvent{window[i].timestamp_ms(), detail});
      }
    }
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const AnomalyEvent& a, const AnomalyEvent& b) { return a.timestamp_ms < b.timestamp_ms; });
  return events;
}

MetricAnomaly AnomalyDetector::evaluate_range(const model::Resource resource, const std::vector<double>& series,
                                              const std::size_t newest_index) const {
  MetricAnomaly result{};
  result.resource = resource;
  result.value = series[newest_index];

  std::size_t begin = 0;
  if (options_.window != 0 && newest_index > options_.window) {
    begin = newest_index - options_.window;
  }
  const std::vector<double> history(series.begin() + static_cast<std::ptrdiff_t>(begin),
                                    series.begin() + static_cast<std::ptrdiff_t>(newest_index));
  result.history_size = history.size();

  if (history.size() < options_.min_history) {
    result.verdict = AnomalyVerdict::INDETERMINATE;
    return result;
  }

  result.mean = core::mean(history);
  result.stddev = core::sample_stddev(history);
  result.expected_low = result.mean - (options_.k_sigma * result.stddev);
  result.expected_high = result.mean + (options_.k_sigma * result.stddev);

  const double distance = std::fabs(result.value - result.mean);
  if (result.stddev == 0.0) {
    const bool differs = distance > options_.epsilon;
    result.deviation = differs ? std::numeric_limits<double>::infinity() : 0.0;
    result.verdict = differs ? AnomalyVerdict::ANOMALOUS : AnomalyVerdict::NORMAL;
    return result;
  }

  result.deviation = distance / result.stddev;
  result.verdict = distance > options_.k_sigma * result.stddev ? AnomalyVerdict::ANOMALOUS : AnomalyVerdict::NORMAL;
  return result;
}

}  // namespace capacity_planner::risk
