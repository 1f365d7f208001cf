#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/analysis_pass.hpp"
#include "core/config.hpp"
#include "core/sample_window.hpp"
#include "forecast/forecast_model.hpp"
#include "sinks/json_report.hpp"
#include "sinks/redis_ts.hpp"
#include "store/json_store.hpp"
#include "store/redis_ts_store.hpp"
#include "store/sample_store.hpp"

using capacity_planner::core::AnalysisConfig;
using capacity_planner::core::AnalysisPass;
using capacity_planner::core::NodeAnalysis;
using capacity_planner::core::NodeReport;
using capacity_planner::core::PassStats;
using capacity_planner::core::summarize;
using capacity_planner::forecast::ForecastModel;
using capacity_planner::forecast::ModelRequest;
using capacity_planner::forecast::Series;
using capacity_planner::model::ForecastPoint;
using capacity_planner::model::ModelType;
using capacity_planner::model::RawSample;
using capacity_planner::model::Resource;
using capacity_planner::model::RiskLevel;
using capacity_planner::model::Severity;
using capacity_planner::risk::RiskClassifier;
using capacity_planner::risk::UtilizationReading;
using capacity_planner::sinks::JsonReportSink;
using capacity_planner::sinks::RedisTsOptions;
using capacity_planner::sinks::RedisTsSink;
using capacity_planner::store::MemorySampleStore;
using capacity_planner::store::RedisStoreOptions;
using capacity_planner::store::RedisTsSampleStore;
using capacity_planner::store::parse_sample_records;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  std::vector<std::vector<std::string>> argv_history{};
  int command_calls{0};
  int command_argv_calls{0};
  std::vector<std::string> keys{};
  // key -> (timestamp, value)
  std::map<std::string, std::vector<std::pair<std::int64_t, std::string>>> series{};
};

RedisMockState g_redis_mock{};

redisReply* new_reply(const int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* string_reply(const int type, const std::string& text) {
  auto* reply = new_reply(type);
  reply->str = static_cast<char*>(std::calloc(text.size() + 1, 1));
  std::memcpy(reply->str, text.data(), text.size());
  reply->len = text.size();
  return reply;
}

redisReply* array_reply(const std::vector<redisReply*>& elements) {
  auto* reply = new_reply(REDIS_REPLY_ARRAY);
  reply->elements = elements.size();
  if (!elements.empty()) {
    reply->element = static_cast<redisReply**>(std::calloc(elements.size(), sizeof(redisReply*)));
    for (std::size_t i = 0; i < elements.size(); ++i) {
      reply->element[i] = elements[i];
    }
  }
  return reply;
}

redisReply* range_reply(const std::vector<std::string>& argv) {
  const auto it = g_redis_mock.series.find(argv[1]);
  if (it == g_redis_mock.series.end()) {
    return string_reply(REDIS_REPLY_ERROR, "ERR TSDB: the key does not exist");
  }

  const std::int64_t start = std::stoll(argv[2]);
  const std::int64_t end = std::stoll(argv[3]);
  std::vector<redisReply*> points;
  for (const auto& [timestamp, value] : it->second) {
    if (timestamp < start || timestamp > end) {
      continue;
    }
    auto* ts = new_reply(REDIS_REPLY_INTEGER);
    ts->integer = timestamp;
    points.push_back(array_reply({ts, string_reply(REDIS_REPLY_STRING, value)}));
  }
  return array_reply(points);
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  g_redis_mock.command_calls += 1;
  return new_reply(REDIS_REPLY_STATUS);
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i], argvlen[i]);
  }
  g_redis_mock.argv_history.push_back(g_redis_mock.last_argv);

  const std::string& name = g_redis_mock.last_argv.front();
  if (name == "KEYS") {
    std::vector<redisReply*> keys;
    for (const auto& key : g_redis_mock.keys) {
      keys.push_back(string_reply(REDIS_REPLY_STRING, key));
    }
    return array_reply(keys);
  }
  if (name == "TS.RANGE") {
    return range_reply(g_redis_mock.last_argv);
  }
  return new_reply(REDIS_REPLY_ARRAY);
}

void freeReplyObject(void* reply) {
  auto* r = static_cast<redisReply*>(reply);
  if (r == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < r->elements; ++i) {
    freeReplyObject(r->element[i]);
  }
  std::free(r->element);
  std::free(r->str);
  std::free(r);
}

}  // extern "C"

namespace {

constexpr std::int64_t kHour = 3'600'000;
constexpr std::int64_t kStart = 1'700'000'000'000;

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

RawSample raw_sample(const std::string& node, const std::int64_t ts, const std::int64_t vcpus_used) {
  RawSample raw{};
  raw.timestamp_ms = ts;
  raw.node = node;
  raw.vcpus_used = vcpus_used;
  raw.vcpus_total = 100;
  raw.memory_used_mb = 40.0 * 1024.0;
  raw.memory_total_mb = 100.0 * 1024.0;
  raw.disk_used_gb = 300.0;
  raw.disk_total_gb = 1000.0;
  raw.instances = 4;
  return raw;
}

std::vector<nlohmann::json> json_lines(const std::string& text) {
  std::vector<nlohmann::json> lines;
  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(nlohmann::json::parse(line));
    }
  }
  return lines;
}

bool argv_has_value(const std::vector<std::string>& argv, const std::string& key, const std::string& value) {
  // TS.MADD key timestamp value [key timestamp value ...]
  for (std::size_t i = 1; i + 2 < argv.size(); i += 3) {
    if (argv[i] == key) {
      return argv[i + 2] == value;
    }
  }
  return false;
}

bool argv_has_key(const std::vector<std::string>& argv, const std::string& key) {
  for (const auto& arg : argv) {
    if (arg == key) {
      return true;
    }
  }
  return false;
}

int test_pass_end_to_end() {
  MemorySampleStore store;
  for (std::int64_t i = 0; i < 30; ++i) {
    store.append(raw_sample("compute-a", kStart + (i * kHour), i == 29 ? 90 : 50 + (i % 3)));
  }
  store.append(raw_sample("compute-b", kStart, 150));

  AnalysisConfig config{};
  config.schedule.nodes = {"compute-c", "compute-b", "compute-a"};

  std::ostringstream output;
  AnalysisPass pass(config, store);
  pass.add_sink(std::make_unique<JsonReportSink>(output));
  const auto result = pass.run_once(kStart + (29 * kHour));

  if (result.reports.size() != 3 || result.reports[0].node != "compute-a" || result.reports[2].node != "compute-c") {
    return fail("test_pass_end_to_end", "every configured node should be reported in name order");
  }

  const NodeReport& a = result.reports[0];
  if (a.failed || !a.risk.has_value() || a.risk->level(Resource::CPU) != RiskLevel::CRITICAL) {
    return fail("test_pass_end_to_end", "latest 90% cpu should be critical");
  }
  if (!a.anomalies.metric(Resource::CPU).anomalous() || a.anomalies.metric(Resource::MEMORY).anomalous()) {
    return fail("test_pass_end_to_end", "only the cpu spike should be anomalous");
  }
  const auto& cpu_forecast = a.forecast(Resource::CPU);
  if (!cpu_forecast.run.has_value() || cpu_forecast.run->points.size() != 24 || !cpu_forecast.run->fallback_reason) {
    return fail("test_pass_end_to_end", "30 points should give a naive forecast with a fallback reason");
  }
  if (cpu_forecast.run->outliers_removed != 1 || cpu_forecast.run->history_size != 29 ||
      cpu_forecast.run->points.front().timestamp_ms != kStart + (30 * kHour)) {
    return fail("test_pass_end_to_end", "the 90% spike should be trimmed from the forecast history only");
  }
  if (a.recommendations.empty() || a.recommendations.front().severity != Severity::CRITICAL ||
      a.recommendations.front().resource != Resource::CPU || !a.recommendations.front().anomalous) {
    return fail("test_pass_end_to_end", "critical cpu recommendation should come first");
  }

  const NodeReport& b = result.reports[1];
  if (!b.failed || b.forecast(Resource::CPU).unavailable_reason != "no valid samples") {
    return fail("test_pass_end_to_end", "all-invalid node should fail without stopping the pass");
  }

  const NodeReport& c = result.reports[2];
  if (c.failed || !c.analysis.insufficient_data || c.forecast(Resource::DISK).run.has_value()) {
    return fail("test_pass_end_to_end", "node without samples should be insufficient, not failed");
  }

  const PassStats& stats = result.stats;
  if (stats.nodes_listed != 3 || stats.nodes_analyzed != 2 || stats.nodes_failed != 1 || stats.nodes_skipped != 0 ||
      stats.anomalies != 1 || stats.recommendations[static_cast<std::size_t>(Severity::CRITICAL)] != 1) {
    return fail("test_pass_end_to_end", "pass statistics mismatch");
  }

  const auto& summary = result.summary;
  if (summary.nodes != 3 || summary.nodes_with_data != 1 || summary.nodes_at_risk != 1 ||
      summary.worst_risk != RiskLevel::CRITICAL || summary.vcpus_used != 90 || summary.vcpus_total != 100 ||
      summary.instances != 4 || !almost_equal(summary.utilization[2], 30.0)) {
    return fail("test_pass_end_to_end", "cluster summary mismatch");
  }

  const auto lines = json_lines(output.str());
  if (lines.size() != 4) {
    return fail("test_pass_end_to_end", "expected three node reports and one summary");
  }
  const auto& a_cpu = lines[0]["forecasts"]["cpu_utilization"];
  if (!a_cpu["forecast"].is_array() || a_cpu["model"] != "naive_trend") {
    return fail("test_pass_end_to_end", "available forecast should be serialized as points");
  }
  const auto& c_cpu = lines[2]["forecasts"]["cpu_utilization"];
  if (!c_cpu["forecast"].is_null() || c_cpu["unavailable_reason"] != "no samples in window") {
    return fail("test_pass_end_to_end", "missing forecast should be null with a reason");
  }
  if (lines[1]["failed"] != true || !lines[1]["risk"].is_null()) {
    return fail("test_pass_end_to_end", "failed node should be serialized without risk");
  }
  if (lines[3]["type"] != "cluster_summary" || lines[3]["pass"]["nodes_failed"] != 1 ||
      lines[3]["pass"]["recommendations"]["Critical"] != 1) {
    return fail("test_pass_end_to_end", "summary line mismatch");
  }

  return 0;
}

int test_pass_cancellation() {
  MemorySampleStore store;
  for (const char* node : {"compute-a", "compute-b", "compute-c"}) {
    for (std::int64_t i = 0; i < 5; ++i) {
      store.append(raw_sample(node, kStart + (i * kHour), 40));
    }
  }

  std::ostringstream output;
  AnalysisPass pass(AnalysisConfig{}, store);
  pass.add_sink(std::make_unique<JsonReportSink>(output));

  int polls = 0;
  const auto result = pass.run_once(kStart + (4 * kHour), [&polls]() { return ++polls > 1; });

  if (!result.stats.cancelled || result.stats.nodes_listed != 3 || result.stats.nodes_skipped != 2) {
    return fail("test_pass_cancellation", "cancel after the first node should skip the rest");
  }
  if (result.reports.size() != 1 || result.reports[0].node != "compute-a" || result.summary.nodes != 1) {
    return fail("test_pass_cancellation", "only the finished node should be reported");
  }

  const auto lines = json_lines(output.str());
  if (lines.size() != 2 || lines[1]["pass"]["cancelled"] != true) {
    return fail("test_pass_cancellation", "summary should still be published after cancellation");
  }

  return 0;
}

int test_node_analysis_window_edges() {
  const NodeAnalysis analysis{AnalysisConfig{}};

  std::vector<RawSample> raw;
  raw.push_back(raw_sample("compute-a", kStart, 20));
  raw.push_back(raw_sample("compute-a", kStart, 21));
  RawSample zero = raw_sample("compute-a", kStart + kHour, 0);
  zero.vcpus_total = 0;
  raw.push_back(zero);

  const auto report = analysis.analyze("compute-a", raw, kStart + kHour);
  if (report.failed || report.analysis.excluded.out_of_order != 1 || report.exclusion_reasons.empty()) {
    return fail("test_node_analysis_window_edges", "duplicate should be excluded and counted");
  }
  if (!report.risk.has_value() || report.risk->level(Resource::CPU) != RiskLevel::HEALTHY ||
      !report.risk->data_quality_warning[0]) {
    return fail("test_node_analysis_window_edges", "zero total should be healthy with a data-quality flag");
  }
  if (report.forecast(Resource::CPU).run.has_value() ||
      report.forecast(Resource::CPU).unavailable_reason.find("need 10") == std::string::npos) {
    return fail("test_node_analysis_window_edges", "two points should leave the forecast unavailable");
  }

  return 0;
}

int test_summary_ignores_failed_nodes() {
  NodeReport healthy{};
  healthy.node = "compute-a";
  healthy.latest.emplace(raw_sample("compute-a", kStart, 20));
  UtilizationReading reading{};
  reading.utilization = {20.0, 40.0, 30.0};
  healthy.risk = RiskClassifier{}.assess(reading);

  NodeReport failed{};
  failed.node = "compute-b";
  failed.failed = true;

  const auto summary = summarize({healthy, failed}, kStart);
  if (summary.nodes != 2 || summary.nodes_with_data != 1 || summary.nodes_at_risk != 0 ||
      summary.worst_risk != RiskLevel::HEALTHY || !almost_equal(summary.utilization[0], 20.0)) {
    return fail("test_summary_ignores_failed_nodes", "failed node should not contribute capacity");
  }

  const auto empty = summarize({}, kStart);
  if (empty.nodes != 0 || empty.utilization[0] != 0.0) {
    return fail("test_summary_ignores_failed_nodes", "empty pass should give a zero summary");
  }

  return 0;
}

int test_parse_sample_records() {
  std::istringstream input(R"([
    {"timestamp": "2024-01-01T00:00:00Z", "node": "compute-a", "vcpus_used": 4.0, "vcpus_total": 16,
     "memory_used_mb": 2048.5, "memory_total_mb": 8192, "disk_used_gb": 10, "disk_total_gb": 100,
     "instances": 2, "hypervisor_type": "QEMU"},
    {"timestamp": 1704067260000, "node": "compute-a", "vcpus_used": "many", "vcpus_total": 16}
  ])");

  const auto samples = parse_sample_records(input);
  if (samples.size() != 2) {
    return fail("test_parse_sample_records", "expected two records");
  }
  if (samples[0].timestamp_ms != 1704067200000 || samples[0].vcpus_used != 4 ||
      samples[0].hypervisor_type != std::optional<std::string>("QEMU") || samples[0].state.has_value()) {
    return fail("test_parse_sample_records", "first record fields mismatch");
  }
  if (samples[1].timestamp_ms != 1704067260000 || samples[1].vcpus_used.has_value() ||
      samples[1].memory_used_mb.has_value()) {
    return fail("test_parse_sample_records", "wrong-typed and absent fields should stay empty");
  }

  const auto window = capacity_planner::core::build_sample_window("compute-a", samples);
  if (window.size() != 1 || window.excluded.missing_data != 1) {
    return fail("test_parse_sample_records", "incomplete record should be excluded as missing data");
  }

  std::istringstream oversized(R"([
    {"timestamp": 1e30, "node": "compute-a", "vcpus_used": 1e25, "vcpus_total": 18446744073709551615,
     "memory_used_mb": 1, "memory_total_mb": 2, "disk_used_gb": 1, "disk_total_gb": 2, "instances": -1e300}
  ])");
  const auto huge = parse_sample_records(oversized);
  if (huge.size() != 1 || huge[0].timestamp_ms.has_value() || huge[0].vcpus_used.has_value() ||
      huge[0].vcpus_total.has_value() || huge[0].instances.has_value()) {
    return fail("test_parse_sample_records", "whole numbers outside the int64 range should stay empty");
  }
  const auto mixed = capacity_planner::core::build_sample_window("compute-a", {samples[0], huge[0]});
  if (mixed.size() != 1 || mixed.excluded.missing_data != 1) {
    return fail("test_parse_sample_records", "out-of-range record should be excluded as missing data");
  }

  for (const char* document : {"{\"node\": \"x\"}", "[1, 2]", "[{\"node\": "}) {
    std::istringstream bad(document);
    try {
      (void)parse_sample_records(bad);
      return fail("test_parse_sample_records", "malformed document should throw");
    } catch (const std::runtime_error&) {
    }
  }

  return 0;
}

int test_redis_store_reads_samples() {
  g_redis_mock = {};
  g_redis_mock.keys = {"capacity:compute-b:vcpus_total", "capacity:compute-a:vcpus_total",
                       "capacity:compute-a:vcpus_total", "capacity::vcpus_total"};
  g_redis_mock.series["capacity:compute-a:vcpus_used"] = {{1000, "10"}, {2000, "12"}};
  g_redis_mock.series["capacity:compute-a:vcpus_total"] = {{1000, "100"}, {2000, "100"}};
  g_redis_mock.series["capacity:compute-a:memory_used_mb"] = {{1000, "512.5"}};
  g_redis_mock.series["capacity:compute-a:memory_total_mb"] = {{1000, "1024"}, {2000, "1024"}};
  g_redis_mock.series["capacity:compute-a:disk_used_gb"] = {{1000, "5"}, {2000, "6"}};
  g_redis_mock.series["capacity:compute-a:disk_total_gb"] = {{1000, "50"}, {2000, "50"}};
  g_redis_mock.series["capacity:compute-a:instances"] = {{1000, "3"}, {2000, "3.5"}};

  RedisTsSampleStore store(RedisStoreOptions{});
  const auto nodes = store.list_nodes();
  if (nodes != std::vector<std::string>{"compute-a", "compute-b"}) {
    return fail("test_redis_store_reads_samples", "node list should be parsed, sorted and unique");
  }

  const auto window = store.get_window("compute-a", 0, 5000);
  if (window.size() != 2) {
    return fail("test_redis_store_reads_samples", "fields should merge into one sample per timestamp");
  }
  if (window[0].timestamp_ms != 1000 || window[0].vcpus_used != 10 || window[0].node != std::optional<std::string>("compute-a") ||
      !window[0].memory_used_mb.has_value() || !almost_equal(*window[0].memory_used_mb, 512.5) ||
      window[0].instances != 3) {
    return fail("test_redis_store_reads_samples", "first sample fields mismatch");
  }
  if (window[1].memory_used_mb.has_value() || window[1].instances.has_value()) {
    return fail("test_redis_store_reads_samples", "absent or fractional fields should stay empty");
  }

  const auto later = store.get_window("compute-a", 1500, 5000);
  if (later.size() != 1 || later[0].timestamp_ms != 2000) {
    return fail("test_redis_store_reads_samples", "range should be passed to TS.RANGE");
  }

  if (!store.get_window("compute-z", 0, 5000).empty()) {
    return fail("test_redis_store_reads_samples", "missing keys should give an empty window");
  }

  return 0;
}

int test_redis_store_rejects_out_of_range_counts() {
  g_redis_mock = {};
  g_redis_mock.series["capacity:compute-a:vcpus_used"] = {{1000, "1e25"}};
  g_redis_mock.series["capacity:compute-a:vcpus_total"] = {{1000, "16"}};
  g_redis_mock.series["capacity:compute-a:instances"] = {{1000, "-1e30"}};

  RedisTsSampleStore store(RedisStoreOptions{});
  const auto window = store.get_window("compute-a", 0, 5000);
  if (window.size() != 1 || window[0].vcpus_total != 16) {
    return fail("test_redis_store_rejects_out_of_range_counts", "in-range fields should still be read");
  }
  if (window[0].vcpus_used.has_value() || window[0].instances.has_value()) {
    return fail("test_redis_store_rejects_out_of_range_counts", "counts outside the int64 range should stay empty");
  }

  return 0;
}

class InvertedBoundsModel final : public ForecastModel {
 public:
  ModelType type() const override { return ModelType::CUSTOM; }

  std::size_t min_history() const override { return 2; }

  std::vector<ForecastPoint> predict(const Series& history, const ModelRequest& request) const override {
    std::vector<ForecastPoint> points;
    for (std::size_t step = 1; step <= request.horizon; ++step) {
      ForecastPoint point{};
      point.step = step;
      point.timestamp_ms = history.back().timestamp_ms + (static_cast<std::int64_t>(step) * request.step_ms);
      point.forecast = 50.0;
      point.lower_bound = 54.0;
      point.upper_bound = 45.0;
      point.confidence = request.confidence;
      point.model_type = type();
      points.push_back(point);
    }
    return points;
  }
};

int test_node_analysis_survives_bad_custom_model() {
  std::vector<RawSample> raw;
  for (std::int64_t i = 0; i < 30; ++i) {
    raw.push_back(raw_sample("compute-a", kStart + (i * kHour), 50 + (i % 3)));
  }

  AnalysisConfig config{};
  config.schedule.backtest = true;
  const NodeAnalysis analysis(config, std::make_unique<InvertedBoundsModel>());
  const auto report = analysis.analyze("compute-a", raw, kStart + (29 * kHour));

  if (report.failed || !report.risk.has_value() || report.analysis.node != "compute-a") {
    return fail("test_node_analysis_survives_bad_custom_model", "risk and analysis should survive a model error");
  }
  const auto& cpu = report.forecast(Resource::CPU);
  if (cpu.run.has_value() || cpu.unavailable_reason.find("outside its lower bound/upper bound") == std::string::npos) {
    return fail("test_node_analysis_survives_bad_custom_model", "model error should become the unavailable reason");
  }
  if (cpu.backtest.has_value() ||
      cpu.backtest_unavailable_reason.find("outside its lower bound/upper bound") == std::string::npos) {
    return fail("test_node_analysis_survives_bad_custom_model", "backtest should report the model error too");
  }

  return 0;
}

int test_redis_sink_publish() {
  g_redis_mock = {};

  NodeReport report{};
  report.node = "compute-a";
  report.generated_at_ms = kStart;
  UtilizationReading reading{};
  reading.utilization = {95.0, 40.0, 30.0};
  report.risk = RiskClassifier{}.assess(reading);

  RedisTsSink sink(RedisTsOptions{});
  if (!sink.publish(report)) {
    return fail("test_redis_sink_publish", "publish should succeed with mock redis");
  }
  const auto& argv = g_redis_mock.last_argv;
  if (argv.empty() || argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publish", "TS.MADD command not emitted");
  }
  if (!argv_has_value(argv, "capacity:compute-a:report:risk:cpu", "2.000000") ||
      !argv_has_value(argv, "capacity:compute-a:report:risk:overall", "2.000000") ||
      !argv_has_value(argv, "capacity:compute-a:report:failed", "0.000000")) {
    return fail("test_redis_sink_publish", "risk series should be published");
  }
  if (argv_has_key(argv, "capacity:compute-a:report:forecast:cpu") ||
      argv_has_key(argv, "capacity:compute-a:report:anomaly:cpu")) {
    return fail("test_redis_sink_publish", "absent forecasts and indeterminate anomalies should be omitted");
  }
  if (g_redis_mock.command_calls == 0) {
    return fail("test_redis_sink_publish", "series keys should be created before the first write");
  }

  const int created = g_redis_mock.command_calls;
  if (!sink.publish(report) || g_redis_mock.command_calls != created) {
    return fail("test_redis_sink_publish", "known keys should not be created twice");
  }

  capacity_planner::core::ClusterSummary summary{};
  summary.generated_at_ms = kStart;
  summary.nodes = 3;
  if (!sink.publish_summary(summary, PassStats{}) ||
      !argv_has_value(g_redis_mock.last_argv, "capacity:cluster:nodes", "3.000000")) {
    return fail("test_redis_sink_publish", "cluster series should be published");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_pass_end_to_end(); rc != 0) {
    return rc;
  }
  if (int rc = test_pass_cancellation(); rc != 0) {
    return rc;
  }
  if (int rc = test_node_analysis_window_edges(); rc != 0) {
    return rc;
  }
  if (int rc = test_summary_ignores_failed_nodes(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_sample_records(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_reads_samples(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_rejects_out_of_range_counts(); rc != 0) {
    return rc;
  }
  if (int rc = test_node_analysis_survives_bad_custom_model(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_sink_publish(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] pass unit tests\n";
  return 0;
}
