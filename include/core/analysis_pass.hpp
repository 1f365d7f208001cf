#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/node_report.hpp"
#include "derived/utilization_analyzer.hpp"
#include "forecast/forecast_model.hpp"
#include "forecast/forecaster.hpp"
#include "planning/recommendation_engine.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/risk_classifier.hpp"
#include "sinks/report_sink.hpp"
#include "store/sample_store.hpp"

namespace capacity_planner::core {

// The per-node pipeline. Holds only immutable configuration, so one instance may analyze
// different nodes from several threads.
class NodeAnalysis {
 public:
  explicit NodeAnalysis(const AnalysisConfig& config, std::unique_ptr<forecast::ForecastModel> custom = nullptr);

  // Data problems are recorded in the report instead of thrown.
  NodeReport analyze(const std::string& node, const std::vector<model::RawSample>& raw, std::int64_t now_ms) const;

 private:
  ForecastOutcome forecast_resource(const SampleWindow& window, model::Resource resource) const;

  risk::RiskClassifier classifier_;
  risk::AnomalyDetector detector_;
  derived::UtilizationAnalyzer analyzer_;
  forecast::Forecaster forecaster_;
  planning::RecommendationEngine engine_;
  bool backtest_{false};
};

struct PassResult {
  PassStats stats{};
  std::vector<NodeReport> reports{};
  ClusterSummary summary{};
};

class AnalysisPass {
 public:
  using CancelCheck = std::function<bool()>;

  AnalysisPass(const AnalysisConfig& config, store::SampleStore& store);

  void add_sink(std::unique_ptr<sinks::ReportSink> sink);

  // One batch over all nodes. cancel is polled before each node.
  PassResult run_once(std::int64_t now_ms, const CancelCheck& cancel = {});

 private:
  std::vector<std::string> nodes_to_analyze(PassStats& stats);
  void publish(const NodeReport& report);
  void publish_summary(const ClusterSummary& summary, const PassStats& stats);

  ScheduleConfig schedule_;
  NodeAnalysis analysis_;
  store::SampleStore& store_;
  std::vector<std::unique_ptr<sinks::ReportSink>> sinks_{};
  std::vector<bool> sink_was_ok_{};
};

}  // namespace capacity_planner::core
