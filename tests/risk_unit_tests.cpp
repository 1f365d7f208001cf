#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "model/metric_sample.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/risk_classifier.hpp"

using capacity_planner::core::InvalidConfiguration;
using capacity_planner::core::MissingData;
using capacity_planner::core::load_analysis_config;
using capacity_planner::core::parse_analysis_config;
using capacity_planner::model::MetricSample;
using capacity_planner::model::RawSample;
using capacity_planner::model::Resource;
using capacity_planner::model::RiskLevel;
using capacity_planner::model::UsageRisk;
using capacity_planner::risk::AnomalyDetector;
using capacity_planner::risk::AnomalyOptions;
using capacity_planner::risk::AnomalyVerdict;
using capacity_planner::risk::ResourceThresholds;
using capacity_planner::risk::RiskClassifier;
using capacity_planner::risk::RiskThresholds;
using capacity_planner::risk::UtilizationReading;

namespace {

constexpr std::int64_t kHour = 3'600'000;
constexpr std::int64_t kStart = 1'700'000'000'000;

bool almost_equal(double a, double b, double epsilon = 1e-6) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

RawSample raw_sample(const std::int64_t ts, const std::int64_t vcpus_used, const double memory_used_mb,
                     const double disk_used_gb) {
  RawSample raw{};
  raw.timestamp_ms = ts;
  raw.node = "compute-01";
  raw.vcpus_used = vcpus_used;
  raw.vcpus_total = 100;
  raw.memory_used_mb = memory_used_mb;
  raw.memory_total_mb = 100.0;
  raw.disk_used_gb = disk_used_gb;
  raw.disk_total_gb = 100.0;
  raw.instances = 4;
  return raw;
}

std::vector<MetricSample> cpu_window(const std::vector<std::int64_t>& cpu_used) {
  std::vector<MetricSample> window;
  for (std::size_t i = 0; i < cpu_used.size(); ++i) {
    window.emplace_back(raw_sample(kStart + (static_cast<std::int64_t>(i) * kHour), cpu_used[i], 40.0, 40.0));
  }
  return window;
}

UtilizationReading reading(const double cpu, const double memory, const double disk) {
  UtilizationReading r{};
  r.utilization = {cpu, memory, disk};
  return r;
}

int test_classifier_boundaries() {
  const ResourceThresholds thresholds{60.0, 80.0};

  if (RiskClassifier::classify(60.0, thresholds) != RiskLevel::HEALTHY) {
    return fail("test_classifier_boundaries", "value equal to warning should stay healthy");
  }
  if (RiskClassifier::classify(60.01, thresholds) != RiskLevel::WARNING) {
    return fail("test_classifier_boundaries", "value above warning should be warning");
  }
  if (RiskClassifier::classify(80.0, thresholds) != RiskLevel::WARNING) {
    return fail("test_classifier_boundaries", "value equal to critical should be warning");
  }
  if (RiskClassifier::classify(80.5, thresholds) != RiskLevel::CRITICAL) {
    return fail("test_classifier_boundaries", "value above critical should be critical");
  }
  if (RiskClassifier::classify(0.0, thresholds) != RiskLevel::HEALTHY) {
    return fail("test_classifier_boundaries", "idle value should be healthy");
  }
  if (RiskClassifier::classify_usage(70.0, thresholds) != UsageRisk::MEDIUM ||
      RiskClassifier::classify_usage(95.0, thresholds) != UsageRisk::HIGH ||
      RiskClassifier::classify_usage(10.0, thresholds) != UsageRisk::LOW) {
    return fail("test_classifier_boundaries", "usage risk should follow the same boundaries");
  }

  return 0;
}

int test_classifier_per_resource_thresholds_and_overall_max() {
  RiskThresholds thresholds{};
  thresholds.disk = ResourceThresholds{85.0, 95.0};
  const RiskClassifier classifier(thresholds);

  const auto assessment = classifier.assess(reading(65.0, 10.0, 90.0));
  if (assessment.level(Resource::CPU) != RiskLevel::WARNING) {
    return fail("test_classifier_per_resource_thresholds_and_overall_max", "cpu should be warning");
  }
  if (assessment.level(Resource::MEMORY) != RiskLevel::HEALTHY) {
    return fail("test_classifier_per_resource_thresholds_and_overall_max", "memory should be healthy");
  }
  if (assessment.level(Resource::DISK) != RiskLevel::WARNING) {
    return fail("test_classifier_per_resource_thresholds_and_overall_max", "disk should use its own thresholds");
  }
  if (assessment.overall != RiskLevel::WARNING) {
    return fail("test_classifier_per_resource_thresholds_and_overall_max", "overall should be the worst level");
  }

  const auto critical = classifier.assess(reading(10.0, 81.0, 10.0));
  if (critical.overall != RiskLevel::CRITICAL) {
    return fail("test_classifier_per_resource_thresholds_and_overall_max", "a single critical resource dominates");
  }

  return 0;
}

int test_classifier_zero_total_is_healthy_with_warning() {
  RawSample raw = raw_sample(kStart, 0, 50.0, 10.0);
  raw.vcpus_total = 0;
  const MetricSample sample(raw);

  const RiskClassifier classifier;
  const auto assessment = classifier.assess(sample);
  if (assessment.level(Resource::CPU) != RiskLevel::HEALTHY) {
    return fail("test_classifier_zero_total_is_healthy_with_warning", "zero total should classify as healthy");
  }
  if (!assessment.data_quality_warning[0] || !assessment.has_data_quality_warning()) {
    return fail("test_classifier_zero_total_is_healthy_with_warning", "zero total should raise a data-quality flag");
  }
  if (assessment.data_quality_warning[1] || assessment.data_quality_warning[2]) {
    return fail("test_classifier_zero_total_is_healthy_with_warning", "other resources should not be flagged");
  }

  return 0;
}

int test_classifier_rejects_missing_values() {
  const RiskClassifier classifier;

  UtilizationReading missing = reading(10.0, 10.0, 10.0);
  missing.utilization[1].reset();
  try {
    (void)classifier.assess(missing);
    return fail("test_classifier_rejects_missing_values", "missing memory should throw");
  } catch (const MissingData&) {
  }

  const UtilizationReading nan = reading(std::numeric_limits<double>::quiet_NaN(), 10.0, 10.0);
  try {
    (void)classifier.assess(nan);
    return fail("test_classifier_rejects_missing_values", "non-finite cpu should throw");
  } catch (const MissingData&) {
  }

  return 0;
}

int test_classifier_rejects_inverted_thresholds() {
  RiskThresholds thresholds{};
  thresholds.cpu = ResourceThresholds{85.0, 80.0};
  try {
    RiskClassifier classifier(thresholds);
    return fail("test_classifier_rejects_inverted_thresholds", "warning above critical should throw");
  } catch (const InvalidConfiguration& ex) {
    if (std::string(ex.what()).find("cpu_warning_pct") == std::string::npos) {
      return fail("test_classifier_rejects_inverted_thresholds", "error should name the offending key");
    }
  }

  thresholds.cpu = ResourceThresholds{60.0, 120.0};
  try {
    RiskClassifier classifier(thresholds);
    return fail("test_classifier_rejects_inverted_thresholds", "critical above 100 should throw");
  } catch (const InvalidConfiguration&) {
  }

  return 0;
}

int test_anomaly_indeterminate_below_min_history() {
  const AnomalyDetector detector;
  const auto report = detector.evaluate(cpu_window({50, 55, 58, 90}));

  if (!report.indeterminate()) {
    return fail("test_anomaly_indeterminate_below_min_history", "short history should be indeterminate");
  }
  if (report.metric(Resource::CPU).history_size != 3) {
    return fail("test_anomaly_indeterminate_below_min_history", "history excludes the newest sample");
  }

  const auto empty = detector.evaluate(std::vector<MetricSample>{});
  if (!empty.indeterminate() || empty.any_anomalous()) {
    return fail("test_anomaly_indeterminate_below_min_history", "empty window should be indeterminate");
  }

  return 0;
}

int test_anomaly_spike_scenario() {
  AnomalyOptions options{};
  options.min_history = 3;
  const AnomalyDetector detector(options);
  const auto window = cpu_window({50, 55, 58, 90});

  const auto report = detector.evaluate(window);
  const auto& cpu = report.metric(Resource::CPU);
  if (cpu.verdict != AnomalyVerdict::ANOMALOUS) {
    return fail("test_anomaly_spike_scenario", "90 after 50/55/58 should be anomalous");
  }
  if (!almost_equal(cpu.mean, 163.0 / 3.0) || !almost_equal(cpu.stddev, std::sqrt(98.0 / 6.0))) {
    return fail("test_anomaly_spike_scenario", "mean/stddev should use the sample estimator over history only");
  }
  if (!almost_equal(cpu.deviation, (90.0 - (163.0 / 3.0)) / std::sqrt(98.0 / 6.0))) {
    return fail("test_anomaly_spike_scenario", "deviation magnitude mismatch");
  }
  if (!(cpu.expected_high < 90.0) || !almost_equal(cpu.expected_high - cpu.mean, 3.0 * cpu.stddev)) {
    return fail("test_anomaly_spike_scenario", "expected range should be mean +/- k sigma");
  }

  const RiskClassifier classifier;
  if (classifier.assess(window.back()).level(Resource::CPU) != RiskLevel::CRITICAL) {
    return fail("test_anomaly_spike_scenario", "latest 90% cpu should be critical");
  }

  if (report.metric(Resource::MEMORY).verdict != AnomalyVerdict::NORMAL) {
    return fail("test_anomaly_spike_scenario", "flat memory equal to its history should be normal");
  }

  return 0;
}

int test_anomaly_constant_history_uses_epsilon() {
  AnomalyOptions options{};
  options.min_history = 3;
  const AnomalyDetector detector(options);

  const auto same = detector.evaluate(Resource::DISK, {40.0, 40.0, 40.0}, 40.0);
  if (same.verdict != AnomalyVerdict::NORMAL || same.deviation != 0.0) {
    return fail("test_anomaly_constant_history_uses_epsilon", "unchanged value should be normal");
  }

  const auto moved = detector.evaluate(Resource::DISK, {40.0, 40.0, 40.0}, 40.5);
  if (moved.verdict != AnomalyVerdict::ANOMALOUS || !std::isinf(moved.deviation)) {
    return fail("test_anomaly_constant_history_uses_epsilon", "any change over a flat history is anomalous");
  }

  return 0;
}

int test_anomaly_trailing_window_and_scan() {
  AnomalyOptions options{};
  options.min_history = 3;
  options.window = 3;
  const AnomalyDetector detector(options);

  // The early outlier falls out of the trailing window before the last sample is judged.
  const auto report = detector.evaluate(cpu_window({5, 50, 51, 50, 51, 50}));
  if (report.metric(Resource::CPU).history_size != 3 || report.metric(Resource::CPU).anomalous()) {
    return fail("test_anomaly_trailing_window_and_scan", "only the trailing window should be considered");
  }

  const auto events = detector.scan(cpu_window({50, 51, 50, 51, 95, 50, 51}));
  if (events.empty()) {
    return fail("test_anomaly_trailing_window_and_scan", "scan should report the spike");
  }
  if (events.front().timestamp_ms != kStart + (4 * kHour) || events.front().detail.resource != Resource::CPU) {
    return fail("test_anomaly_trailing_window_and_scan", "first event should be the cpu spike");
  }
  for (std::size_t i = 1; i < events.size(); ++i) {
    if (events[i].timestamp_ms < events[i - 1].timestamp_ms) {
      return fail("test_anomaly_trailing_window_and_scan", "events should be ordered by time");
    }
  }

  return 0;
}

int test_anomaly_options_validation() {
  AnomalyOptions options{};
  options.k_sigma = 0.0;
  try {
    AnomalyDetector detector(options);
    return fail("test_anomaly_options_validation", "k_sigma 0 should throw");
  } catch (const InvalidConfiguration&) {
  }

  options = AnomalyOptions{};
  options.window = 10;
  options.min_history = 20;
  try {
    AnomalyDetector detector(options);
    return fail("test_anomaly_options_validation", "window shorter than min_history should throw");
  } catch (const InvalidConfiguration&) {
  }

  return 0;
}

int test_config_defaults_and_keys() {
  std::istringstream input(
      "# thresholds\n"
      "cpu_warning_pct: 70\n"
      "cpu_critical_pct: 90\n"
      "anomaly_k_sigma: 2.5\n"
      "forecast_horizon_points: 12\n"
      "forecast_confidence: 0.95\n"
      "anomaly:\n"
      "  min_history: 10\n"
      "  window: 0\n"
      "forecast:\n"
      "  outlier_k_sigma: 2\n"
      "analysis:\n"
      "  window_hours: 87840\n"
      "  nodes: compute-02, compute-01\n"
      "  backtest: yes\n"
      "report:\n"
      "  stdout: false\n"
      "redis:\n"
      "  address: unix:///var/run/redis/redis.sock\n"
      "  key_prefix: \"cap\"\n");

  const auto config = parse_analysis_config(input);
  if (!almost_equal(config.thresholds.cpu.warning_pct, 70.0) || !almost_equal(config.thresholds.cpu.critical_pct, 90.0)) {
    return fail("test_config_defaults_and_keys", "cpu thresholds should parse");
  }
  if (!almost_equal(config.thresholds.memory.warning_pct, 60.0) || !almost_equal(config.thresholds.disk.critical_pct, 80.0)) {
    return fail("test_config_defaults_and_keys", "unset thresholds should keep defaults");
  }
  if (!almost_equal(config.anomaly.k_sigma, 2.5) || config.anomaly.min_history != 10 || config.anomaly.window != 0) {
    return fail("test_config_defaults_and_keys", "anomaly options should parse");
  }
  if (config.forecast.horizon_points != 12 || !almost_equal(config.forecast.confidence, 0.95) ||
      config.forecast.min_history_for_seasonal != 48 || config.forecast.min_history_for_forecast != 10) {
    return fail("test_config_defaults_and_keys", "forecast options should parse with defaults");
  }
  if (!almost_equal(config.forecast.outlier_k_sigma, 2.0) || config.schedule.window_hours != 87840) {
    return fail("test_config_defaults_and_keys", "outlier trimming and the largest window should parse");
  }
  if (config.schedule.nodes.size() != 2 || config.schedule.nodes[0] != "compute-02" || !config.schedule.backtest) {
    return fail("test_config_defaults_and_keys", "analysis section should parse");
  }
  if (config.report.stdout_report) {
    return fail("test_config_defaults_and_keys", "report.stdout should parse as false");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/var/run/redis/redis.sock" || config.redis.key_prefix != "cap") {
    return fail("test_config_defaults_and_keys", "redis section should parse");
  }

  return 0;
}

int test_config_rejects_warning_above_critical() {
  const auto path = std::filesystem::temp_directory_path() / "capacity_planner_inverted.yaml";
  {
    std::ofstream out(path);
    out << "cpu_warning_pct: 85\ncpu_critical_pct: 80\n";
  }

  bool threw = false;
  try {
    (void)load_analysis_config(path.string());
  } catch (const InvalidConfiguration&) {
    threw = true;
  }
  std::filesystem::remove(path);

  if (!threw) {
    return fail("test_config_rejects_warning_above_critical", "warning 85 above critical 80 should be rejected at load");
  }
  return 0;
}

int test_config_rejects_bad_values() {
  const char* bad_documents[] = {
      "cpu_warning_pct: high\n",
      "forecast_confidence: 1.0\n",
      "forecast_horizon_points: 0\n",
      "min_history_for_forecast: -3\n",
      "redis:\n  address: localhost:99999\n",
      "analysis:\n  target_low_pct: 70\n  target_high_pct: 60\n",
      "analysis:\n  backtest: maybe\n",
      "analysis:\n  window_hours: 87841\n",
      "analysis:\n  window_hours: 9223372036854775807\n",
      "forecast:\n  outlier_k_sigma: -1\n",
      "not a key value line\n",
  };

  for (const char* document : bad_documents) {
    std::istringstream input(document);
    try {
      (void)parse_analysis_config(input);
      std::cerr << "  accepted: " << document;
      return fail("test_config_rejects_bad_values", "invalid document should be rejected");
    } catch (const InvalidConfiguration&) {
    }
  }

  try {
    (void)load_analysis_config("/nonexistent/capacity-planner.yaml");
    return fail("test_config_rejects_bad_values", "missing file should throw");
  } catch (const InvalidConfiguration&) {
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_classifier_boundaries(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_per_resource_thresholds_and_overall_max(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_zero_total_is_healthy_with_warning(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_rejects_missing_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_rejects_inverted_thresholds(); rc != 0) {
    return rc;
  }
  if (int rc = test_anomaly_indeterminate_below_min_history(); rc != 0) {
    return rc;
  }
  if (int rc = test_anomaly_spike_scenario(); rc != 0) {
    return rc;
  }
  if (int rc = test_anomaly_constant_history_uses_epsilon(); rc != 0) {
    return rc;
  }
  if (int rc = test_anomaly_trailing_window_and_scan(); rc != 0) {
    return rc;
  }
  if (int rc = test_anomaly_options_validation(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_defaults_and_keys(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_warning_above_critical(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_bad_values(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] risk unit tests\n";
  return 0;
}
