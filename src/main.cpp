#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "core/analysis_pass.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "sinks/json_report.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_report.hpp"
#include "store/json_store.hpp"
#include "store/redis_ts_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string redis_address(const capacity_planner::core::RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

std::string format_config_settings(const capacity_planner::core::AnalysisConfig& config,
                                   const std::string& config_path) {
  std::ostringstream output;
  output << "[planner] loaded config from " << config_path
         << " | cpu_pct=" << config.thresholds.cpu.warning_pct << '/' << config.thresholds.cpu.critical_pct
         << " | memory_pct=" << config.thresholds.memory.warning_pct << '/' << config.thresholds.memory.critical_pct
         << " | disk_pct=" << config.thresholds.disk.warning_pct << '/' << config.thresholds.disk.critical_pct
         << " | anomaly_k_sigma=" << config.anomaly.k_sigma
         << " | forecast_horizon_points=" << config.forecast.horizon_points
         << " | forecast_confidence=" << config.forecast.confidence
         << " | window_hours=" << config.schedule.window_hours
         << " | interval_s=" << config.schedule.interval_s
         << " | backtest=" << (config.schedule.backtest ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  if (config.redis.enabled) {
    output << " | redis_address=" << redis_address(config.redis);
  }
  return output.str();
}

std::unique_ptr<capacity_planner::store::SampleStore> make_store(const capacity_planner::core::AnalysisConfig& config) {
  if (config.redis.source) {
    capacity_planner::store::RedisStoreOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    return std::make_unique<capacity_planner::store::RedisTsSampleStore>(options);
  }

  if (config.store.json_path.empty()) {
    throw capacity_planner::core::InvalidConfiguration("store.json_path is required unless redis.source is set");
  }
  return capacity_planner::store::load_json_store(config.store.json_path);
}

void add_sinks(capacity_planner::core::AnalysisPass& pass, const capacity_planner::core::AnalysisConfig& config) {
  if (config.report.stdout_report) {
    pass.add_sink(std::make_unique<capacity_planner::sinks::StdoutReportSink>());
  }
  if (!config.report.json_path.empty()) {
    pass.add_sink(std::make_unique<capacity_planner::sinks::JsonReportSink>(config.report.json_path));
  }
  if (config.redis.enabled && config.redis.publish) {
    capacity_planner::sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    auto sink = std::make_unique<capacity_planner::sinks::RedisTsSink>(options);

    if (sink->check_connectivity()) {
      std::cerr << "[planner] redis connectivity confirmed at " << redis_address(config.redis) << '\n';
    } else {
      std::cerr << "[planner] redis connectivity check failed at " << redis_address(config.redis) << '\n';
    }
    pass.add_sink(std::move(sink));
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  std::string config_path = "configs/capacity-planner.yaml";
  bool once = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--once") == 0) {
      once = true;
    } else {
      config_path = argv[i];
    }
  }

  capacity_planner::core::AnalysisConfig config{};
  std::unique_ptr<capacity_planner::store::SampleStore> store;
  std::unique_ptr<capacity_planner::core::AnalysisPass> pass;
  try {
    config = capacity_planner::core::load_analysis_config(config_path);
    store = make_store(config);
    pass = std::make_unique<capacity_planner::core::AnalysisPass>(config, *store);
    add_sinks(*pass, config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  const auto cancelled = []() { return g_shutdown_requested != 0; };
  const auto interval = std::chrono::seconds(config.schedule.interval_s);
  auto next_run = std::chrono::steady_clock::now();
  while (g_shutdown_requested == 0) {
    pass->run_once(capacity_planner::core::unix_timestamp_now_ms(), cancelled);
    if (once) {
      break;
    }

    next_run += interval;
    while (g_shutdown_requested == 0 && std::chrono::steady_clock::now() < next_run) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }

  if (g_shutdown_requested != 0) {
    std::cerr << "[planner] shutdown signal received; exiting cleanly\n";
  }
  return 0;
}
