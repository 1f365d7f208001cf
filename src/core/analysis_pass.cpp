#include "core/analysis_pass.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/sample_window.hpp"
#include "core/timestamp.hpp"

namespace capacity_planner::core {
namespace {

void mark_forecasts_unavailable(NodeReport& report, const std::string& reason) {
  for (auto& outcome : report.forecasts) {
    outcome.unavailable_reason = reason;
  }
}

}  // namespace

NodeAnalysis::NodeAnalysis(const AnalysisConfig& config, std::unique_ptr<forecast::ForecastModel> custom)
    : classifier_(config.thresholds),
      detector_(config.anomaly),
      analyzer_(config.band, config.thresholds),
      forecaster_(config.forecast, std::move(custom)),
      engine_(config.thresholds),
      backtest_(config.schedule.backtest) {}

ForecastOutcome NodeAnalysis::forecast_resource(const SampleWindow& window, const model::Resource resource) const {
  ForecastOutcome outcome{};
  const forecast::Series series = forecast::to_series(window, resource);

  try {
    outcome.run = forecaster_.forecast(series);
  } catch (const InsufficientHistory& ex) {
    outcome.unavailable_reason = ex.what();
  } catch (const DataQualityError& ex) {
    outcome.unavailable_reason = ex.what();
  } catch (const ForecastModelError& ex) {
    outcome.unavailable_reason = ex.what();
  }

  if (!backtest_) {
    return outcome;
  }

  try {
    outcome.backtest = forecaster_.backtest(series);
  } catch (const InsufficientHistory& ex) {
    outcome.backtest_unavailable_reason = ex.what();
  } catch (const DataQualityError& ex) {
    outcome.backtest_unavailable_reason = ex.what();
  } catch (const ForecastModelError& ex) {
    outcome.backtest_unavailable_reason = ex.what();
  }
  return outcome;
}

NodeReport NodeAnalysis::analyze(const std::string& node, const std::vector<model::RawSample>& raw,
                                 const std::int64_t now_ms) const {
  NodeReport report{};
  report.node = node;
  report.generated_at_ms = now_ms;
  report.analysis.node = node;

  SampleWindow window{};
  try {
    window = build_sample_window(node, raw);
  } catch (const InsufficientHistory& ex) {
    report.failed = true;
    report.failure = ex.what();
    mark_forecasts_unavailable(report, "no valid samples");
    return report;
  }

  report.exclusion_reasons = window.exclusion_reasons;
  report.analysis = analyzer_.analyze(window);
  report.anomalies = detector_.evaluate(window.samples);

  if (window.empty()) {
    mark_forecasts_unavailable(report, "no samples in window");
    return report;
  }

  report.latest = window.latest();
  try {
    report.risk = classifier_.assess(window.latest());
  } catch (const MissingData& ex) {
    report.failed = true;
    report.failure = ex.what();
    mark_forecasts_unavailable(report, "risk assessment failed");
    return report;
  }

  report.anomaly_events = detector_.scan(window.samples);

  planning::ForecastSet forecasts{};
  for (const auto resource : model::kResources) {
    const auto index = model::index_of(resource);
    report.forecasts[index] = forecast_resource(window, resource);
    forecasts[index] = report.forecasts[index].run;
  }

  report.recommendations = engine_.recommend(report.analysis, *report.risk, report.anomalies, forecasts);
  return report;
}

AnalysisPass::AnalysisPass(const AnalysisConfig& config, store::SampleStore& store)
    : schedule_(config.schedule), analysis_(config), store_(store) {
  validate_config(config);
}

void AnalysisPass::add_sink(std::unique_ptr<sinks::ReportSink> sink) {
  if (sink == nullptr) {
    return;
  }
  sinks_.push_back(std::move(sink));
  sink_was_ok_.push_back(true);
}

std::vector<std::string> AnalysisPass::nodes_to_analyze(PassStats& stats) {
  std::vector<std::string> nodes = schedule_.nodes;
  if (nodes.empty()) {
    try {
      nodes = store_.list_nodes();
    } catch (const std::runtime_error& ex) {
      std::cerr << "[pass] unable to list nodes: " << ex.what() << '\n';
      return {};
    }
  }

  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  stats.nodes_listed = nodes.size();
  return nodes;
}

void AnalysisPass::publish(const NodeReport& report) {
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    const bool ok = sinks_[i]->publish(report);
    if (!ok && sink_was_ok_[i]) {
      std::cerr << "[pass] report sink " << i << " publish failed\n";
      sink_was_ok_[i] = false;
    } else if (ok && !sink_was_ok_[i]) {
      std::cerr << "[pass] report sink " << i << " publish recovered\n";
      sink_was_ok_[i] = true;
    }
  }
}

void AnalysisPass::publish_summary(const ClusterSummary& summary, const PassStats& stats) {
  for (std::size_t i = 0; i < sinks_.size(); ++i) {
    if (!sinks_[i]->publish_summary(summary, stats)) {
      std::cerr << "[pass] report sink " << i << " summary publish failed\n";
    }
  }
}

PassResult AnalysisPass::run_once(const std::int64_t now_ms, const CancelCheck& cancel) {
  PassResult result{};
  const std::vector<std::string> nodes = nodes_to_analyze(result.stats);
  const std::int64_t start_ms = now_ms - (schedule_.window_hours * kMillisPerHour);

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (cancel && cancel()) {
      result.stats.cancelled = true;
      result.stats.nodes_skipped = nodes.size() - i;
      std::cerr << "[pass] cancelled; skipping " << result.stats.nodes_skipped << " nodes\n";
      break;
    }

    const std::string& node = nodes[i];
    NodeReport report{};
    try {
      const std::vector<model::RawSample> raw = store_.get_window(node, start_ms, now_ms);
      report = analysis_.analyze(node, raw, now_ms);
    } catch (const std::runtime_error& ex) {
      // Store failures; analyze() reports data problems itself.
      report = NodeReport{};
      report.node = node;
      report.generated_at_ms = now_ms;
      report.analysis.node = node;
      report.failed = true;
      report.failure = ex.what();
      mark_forecasts_unavailable(report, "no samples fetched");
    }
    report.window_start_ms = start_ms;
    report.window_end_ms = now_ms;

    if (report.failed) {
      ++result.stats.nodes_failed;
      std::cerr << "[pass] node " << node << " failed: " << report.failure << '\n';
    } else {
      ++result.stats.nodes_analyzed;
    }
    for (const auto& metric : report.anomalies.metrics) {
      if (metric.anomalous()) {
        ++result.stats.anomalies;
      }
    }
    for (const auto& recommendation : report.recommendations) {
      ++result.stats.recommendations[static_cast<std::size_t>(recommendation.severity)];
    }

    publish(report);
    result.reports.push_back(std::move(report));
  }

  result.summary = summarize(result.reports, now_ms);
  publish_summary(result.summary, result.stats);

  std::cerr << "[pass] " << format_iso8601(now_ms) << " analyzed=" << result.stats.nodes_analyzed
            << " failed=" << result.stats.nodes_failed << " skipped=" << result.stats.nodes_skipped
            << " anomalies=" << result.stats.anomalies << '\n';
  return result;
}

}  // namespace capacity_planner::core
