#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "sinks/report_sink.hpp"

struct redisContext;

namespace capacity_planner::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"capacity"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes numeric report series to RedisTimeSeries:
//   <prefix>:<node>:report:<series> per node and <prefix>:cluster:<series> per pass.
// A resource without a forecast publishes no forecast sample.
class RedisTsSink final : public ReportSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink() override;

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool check_connectivity();
  bool publish(const core::NodeReport& report) override;
  bool publish_summary(const core::ClusterSummary& summary, const core::PassStats& stats) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  struct Sample {
    std::string key;
    std::int64_t timestamp_ms;
    double value;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_keys(const std::vector<Sample>& samples);
  bool send(const std::vector<Sample>& samples);
  bool send_impl(const std::vector<Sample>& samples);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::unordered_set<std::string> created_keys_{};
  bool timeseries_available_{true};
};

}  // namespace capacity_planner::sinks
