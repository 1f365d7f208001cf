#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "store/sample_store.hpp"

struct redisContext;

namespace capacity_planner::store {

struct RedisStoreOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"capacity"};
  std::uint32_t connect_timeout_ms{1000};
};

// Samples kept as one RedisTimeSeries key per field: <prefix>:<node>:<field>.
// Throws std::runtime_error when Redis is unreachable or replies with an error.
class RedisTsSampleStore final : public SampleStore {
 public:
  explicit RedisTsSampleStore(RedisStoreOptions options = {});
  ~RedisTsSampleStore() override;

  RedisTsSampleStore(const RedisTsSampleStore&) = delete;
  RedisTsSampleStore& operator=(const RedisTsSampleStore&) = delete;

  std::vector<std::string> list_nodes() override;
  std::vector<model::RawSample> get_window(const std::string& node, std::int64_t start_ms,
                                           std::int64_t end_ms) override;

  static const std::vector<std::string>& field_names();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  void ensure_connected();
  void connect();

  RedisStoreOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace capacity_planner::store
