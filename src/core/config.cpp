#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace capacity_planner::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& key, const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw InvalidConfiguration(key + " must be a boolean, got '" + value + "'");
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw InvalidConfiguration(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw InvalidConfiguration(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::size_t parse_count(const std::string& key, const std::string& value) {
  const long long parsed = parse_integer(key, value);
  if (parsed < 0) {
    throw InvalidConfiguration(key + " must be greater than or equal to 0");
  }
  return static_cast<std::size_t>(parsed);
}

double parse_number(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw InvalidConfiguration(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw InvalidConfiguration(key + " must be a finite number, got '" + value + "'");
  }
  return parsed;
}

std::vector<std::string> parse_list(const std::string& value) {
  std::vector<std::string> items;
  std::string current;
  std::istringstream stream(value);
  while (std::getline(stream, current, ',')) {
    current = trim(current);
    if (!current.empty()) {
      items.push_back(current);
    }
  }
  return items;
}

// Accepts a quoted scalar as written by YAML tools.
std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool apply_threshold(risk::RiskThresholds& thresholds, const std::string& key, const std::string& value) {
  struct Entry {
    const char* name;
    risk::ResourceThresholds* target;
  };
  const Entry entries[] = {
      {"cpu", &thresholds.cpu},
      {"memory", &thresholds.memory},
      {"disk", &thresholds.disk},
  };

  for (const auto& entry : entries) {
    const std::string prefix = std::string(entry.name) + "_";
    if (key == prefix + "warning_pct") {
      entry.target->warning_pct = parse_number(key, value);
      return true;
    }
    if (key == prefix + "critical_pct") {
      entry.target->critical_pct = parse_number(key, value);
      return true;
    }
  }
  return false;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("redis.address port", value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw InvalidConfiguration("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AnalysisConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (apply_threshold(config.thresholds, key, value)) {
    return;
  }

  if (key == "anomaly_k_sigma" || key == "anomaly.k_sigma") {
    config.anomaly.k_sigma = parse_number(key, value);
    return;
  }
  if (key == "anomaly.min_history") {
    config.anomaly.min_history = parse_count(key, value);
    return;
  }
  if (key == "anomaly.window") {
    config.anomaly.window = parse_count(key, value);
    return;
  }
  if (key == "anomaly.epsilon") {
    config.anomaly.epsilon = parse_number(key, value);
    return;
  }

  if (key == "forecast_horizon_points" || key == "forecast.horizon_points") {
    config.forecast.horizon_points = parse_count(key, value);
    return;
  }
  if (key == "forecast_confidence" || key == "forecast.confidence") {
    config.forecast.confidence = parse_number(key, value);
    return;
  }
  if (key == "min_history_for_seasonal" || key == "forecast.min_history_for_seasonal") {
    config.forecast.min_history_for_seasonal = parse_count(key, value);
    return;
  }
  if (key == "min_history_for_forecast" || key == "forecast.min_history_for_forecast") {
    config.forecast.min_history_for_forecast = parse_count(key, value);
    return;
  }
  if (key == "forecast.season_length") {
    config.forecast.season_length = parse_count(key, value);
    return;
  }
  if (key == "forecast.backtest_points") {
    config.forecast.backtest_points = parse_count(key, value);
    return;
  }
  if (key == "forecast.outlier_k_sigma") {
    config.forecast.outlier_k_sigma = parse_number(key, value);
    return;
  }

  if (key == "analysis.window_hours") {
    config.schedule.window_hours = parse_integer(key, value);
    return;
  }
  if (key == "analysis.interval_s") {
    config.schedule.interval_s = parse_integer(key, value);
    return;
  }
  if (key == "analysis.nodes") {
    config.schedule.nodes = parse_list(value);
    return;
  }
  if (key == "analysis.backtest") {
    config.schedule.backtest = parse_bool(key, value);
    return;
  }
  if (key == "analysis.target_low_pct") {
    config.band.target_low_pct = parse_number(key, value);
    return;
  }
  if (key == "analysis.target_high_pct") {
    config.band.target_high_pct = parse_number(key, value);
    return;
  }
  if (key == "analysis.underutilized_pct") {
    config.band.underutilized_pct = parse_number(key, value);
    return;
  }

  if (key == "store.json_path") {
    config.store.json_path = value;
    return;
  }

  if (key == "report.stdout") {
    config.report.stdout_report = parse_bool(key, value);
    return;
  }
  if (key == "report.json_path") {
    config.report.json_path = value;
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }
  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0 || db > std::numeric_limits<int>::max()) {
      throw InvalidConfiguration("redis.db must be greater than or equal to 0");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }
  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw InvalidConfiguration("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }
  if (key == "redis.publish") {
    config.redis.publish = parse_bool(key, value);
    return;
  }
  if (key == "redis.source") {
    config.redis.source = parse_bool(key, value);
    return;
  }

  std::cerr << "[config] ignoring unknown key " << key << "\n";
}

}  // namespace

void validate_config(const AnalysisConfig& config) {
  risk::validate(config.thresholds);
  risk::validate(config.anomaly);
  forecast::validate(config.forecast);
  derived::validate(config.band);

  if (config.schedule.window_hours <= 0 || config.schedule.window_hours > kMaxWindowHours) {
    throw InvalidConfiguration("analysis.window_hours must be in range 1.." + std::to_string(kMaxWindowHours));
  }
  if (config.schedule.interval_s <= 0) {
    throw InvalidConfiguration("analysis.interval_s must be greater than 0");
  }
  if (config.redis.source && !config.redis.enabled) {
    throw InvalidConfiguration("redis.source requires redis.address");
  }
}

AnalysisConfig parse_analysis_config(std::istream& input) {
  AnalysisConfig config{};

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      throw InvalidConfiguration("expected 'key: value', got '" + stripped + "'");
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      // Over-indented sections keep empty placeholders for the skipped levels.
      sections.resize(depth);
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_config(config);
  return config;
}

AnalysisConfig load_analysis_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw InvalidConfiguration("unable to open config file: " + path);
  }
  return parse_analysis_config(input);
}

}  // namespace capacity_planner::core
