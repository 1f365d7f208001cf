#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "derived/utilization_analyzer.hpp"
#include "forecast/forecaster.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/risk_classifier.hpp"

namespace capacity_planner::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"capacity"};
  bool enabled{false};
  // Publish report series.
  bool publish{true};
  // Read samples from Redis instead of store.json_path.
  bool source{false};
};

// Ten years; keeps now - window in range.
inline constexpr std::int64_t kMaxWindowHours = 87'840;

struct ScheduleConfig {
  std::int64_t window_hours{168};
  std::int64_t interval_s{3600};
  // Empty means every node the store knows about.
  std::vector<std::string> nodes{};
  bool backtest{false};
};

struct StoreConfig {
  std::string json_path{};
};

struct ReportConfig {
  bool stdout_report{true};
  std::string json_path{};
};

struct AnalysisConfig {
  risk::RiskThresholds thresholds{};
  risk::AnomalyOptions anomaly{};
  forecast::ForecastOptions forecast{};
  derived::EfficiencyBand band{};
  ScheduleConfig schedule{};
  StoreConfig store{};
  ReportConfig report{};
  RedisConfig redis{};
};

// All loaders throw InvalidConfiguration; a returned config has passed validate_config.
AnalysisConfig parse_analysis_config(std::istream& input);
AnalysisConfig load_analysis_config(const std::string& path);

void validate_config(const AnalysisConfig& config);

}  // namespace capacity_planner::core
