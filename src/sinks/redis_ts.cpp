#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace capacity_planner::sinks {
namespace {

double level_value(const model::RiskLevel level) { return static_cast<double>(static_cast<std::uint8_t>(level)); }

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsSink::~RedisTsSink() = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_keys(const std::vector<Sample>& samples) {
  for (const auto& sample : samples) {
    if (created_keys_.count(sample.key) != 0) {
      continue;
    }

    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", sample.key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << sample.key << ": " << reply_message << '\n';
      return false;
    }
    created_keys_.insert(sample.key);
  }
  return true;
}

bool RedisTsSink::send(const std::vector<Sample>& samples) {
  if (samples.empty()) {
    return true;
  }
  if (!ensure_connected()) {
    return false;
  }

  if (send_impl(samples)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return send_impl(samples);
}

bool RedisTsSink::send_impl(const std::vector<Sample>& samples) {
  if (!ensure_keys(samples)) {
    return false;
  }

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.reserve(1 + (samples.size() * 3));
  command_args_.emplace_back("TS.MADD");
  for (const auto& sample : samples) {
    command_args_.emplace_back(sample.key);
    command_args_.emplace_back(std::to_string(sample.timestamp_ms));
    command_args_.emplace_back(std::to_string(sample.value));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::publish(const core::NodeReport& report) {
  const std::string base = options_.key_prefix + ":" + report.node + ":report:";
  const std::int64_t ts = report.generated_at_ms;

  std::vector<Sample> samples;
  const auto add = [&](const std::string& suffix, const double value) {
    if (std::isfinite(value)) {
      samples.push_back(Sample{base + suffix, ts, value});
    }
  };

  add("failed", report.failed ? 1.0 : 0.0);
  if (report.risk.has_value()) {
    add("risk:overall", level_value(report.risk->overall));
  }

  for (const auto resource : model::kResources) {
    const std::string name = model::to_string(resource);
    if (report.risk.has_value()) {
      add("risk:" + name, level_value(report.risk->level(resource)));
      add("utilization:" + name, report.risk->utilization[model::index_of(resource)]);
    }

    const auto& anomaly = report.anomalies.metric(resource);
    if (anomaly.verdict != risk::AnomalyVerdict::INDETERMINATE) {
      add("anomaly:" + name, anomaly.anomalous() ? 1.0 : 0.0);
    }

    const auto& outcome = report.forecast(resource);
    if (outcome.run.has_value() && !outcome.run->points.empty()) {
      const auto& last = outcome.run->points.back();
      add("forecast:" + name, last.forecast);
      add("forecast_upper:" + name, last.upper_bound);
    }
    if (outcome.backtest.has_value()) {
      add("backtest_mae:" + name, outcome.backtest->accuracy.mae);
    }
  }

  std::size_t by_severity[3] = {0, 0, 0};
  for (const auto& recommendation : report.recommendations) {
    ++by_severity[static_cast<std::size_t>(recommendation.severity)];
  }
  add("recommendations:critical", static_cast<double>(by_severity[static_cast<std::size_t>(model::Severity::CRITICAL)]));
  add("recommendations:high", static_cast<double>(by_severity[static_cast<std::size_t>(model::Severity::HIGH)]));
  add("recommendations:medium", static_cast<double>(by_severity[static_cast<std::size_t>(model::Severity::MEDIUM)]));

  return send(samples);
}

bool RedisTsSink::publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) {
  const std::string base = options_.key_prefix + ":cluster:";
  const std::int64_t ts = summary.generated_at_ms;

  std::vector<Sample> samples;
  const auto add = [&](const char* suffix, const double value) {
    samples.push_back(Sample{base + suffix, ts, value});
  };

  add("nodes", static_cast<double>(summary.nodes));
  add("nodes_at_risk", static_cast<double>(summary.nodes_at_risk));
  add("nodes_failed", static_cast<double>(stats.nodes_failed));
  add("worst_risk", level_value(summary.worst_risk));
  add("instances", static_cast<double>(summary.instances));
  add("utilization:cpu", summary.utilization[model::index_of(model::Resource::CPU)]);
  add("utilization:memory", summary.utilization[model::index_of(model::Resource::MEMORY)]);
  add("utilization:disk", summary.utilization[model::index_of(model::Resource::DISK)]);

  return send(samples);
}

}  // namespace capacity_planner::sinks
