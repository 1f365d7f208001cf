#include "store/redis_ts_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace capacity_planner::store {
namespace {

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

RedisReplyPtr command(redisContext* context, const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  auto* raw = static_cast<redisReply*>(
      redisCommandArgv(context, static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (raw == nullptr) {
    throw std::runtime_error("redis command failed: " + args.front());
  }
  return RedisReplyPtr(raw);
}

bool missing_key_error(const redisReply& reply) {
  return reply.type == REDIS_REPLY_ERROR && reply.str != nullptr && std::strstr(reply.str, "does not exist") != nullptr;
}

std::optional<std::int64_t> reply_timestamp(const redisReply* element) {
  if (element == nullptr) {
    return std::nullopt;
  }
  if (element->type == REDIS_REPLY_INTEGER) {
    return static_cast<std::int64_t>(element->integer);
  }
  if (element->str != nullptr) {
    char* end = nullptr;
    const long long parsed = std::strtoll(element->str, &end, 10);
    if (end != element->str && *end == '\0') {
      return static_cast<std::int64_t>(parsed);
    }
  }
  return std::nullopt;
}

std::optional<double> reply_value(const redisReply* element) {
  if (element == nullptr) {
    return std::nullopt;
  }
  if (element->type == REDIS_REPLY_INTEGER) {
    return static_cast<double>(element->integer);
  }
  if (element->str != nullptr) {
    char* end = nullptr;
    const double parsed = std::strtod(element->str, &end);
    if (end != element->str && *end == '\0') {
      return parsed;
    }
  }
  return std::nullopt;
}

// Count fields only take whole values that fit std::int64_t; anything else stays absent and
// is reported as missing.
std::optional<std::int64_t> whole(const double value) {
  constexpr double kInt64Limit = 9223372036854775808.0;
  if (!std::isfinite(value) || std::floor(value) != value || value < -kInt64Limit || value >= kInt64Limit) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

void assign_field(model::RawSample& sample, const std::string& field, const double value) {
  if (field == "vcpus_used") {
    sample.vcpus_used = whole(value);
  } else if (field == "vcpus_total") {
    sample.vcpus_total = whole(value);
  } else if (field == "memory_used_mb") {
    sample.memory_used_mb = value;
  } else if (field == "memory_total_mb") {
    sample.memory_total_mb = value;
  } else if (field == "disk_used_gb") {
    sample.disk_used_gb = value;
  } else if (field == "disk_total_gb") {
    sample.disk_total_gb = value;
  } else if (field == "instances") {
    sample.instances = whole(value);
  }
}

}  // namespace

RedisTsSampleStore::RedisTsSampleStore(RedisStoreOptions options) : options_(std::move(options)) {}

RedisTsSampleStore::~RedisTsSampleStore() = default;

void RedisTsSampleStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

const std::vector<std::string>& RedisTsSampleStore::field_names() {
  static const std::vector<std::string> kFields = {
      "vcpus_used",   "vcpus_total",   "memory_used_mb", "memory_total_mb",
      "disk_used_gb", "disk_total_gb", "instances",
  };
  return kFields;
}

void RedisTsSampleStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return;
  }
  connect();
}

void RedisTsSampleStore::connect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000U);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000U) * 1000U);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }

  if (raw == nullptr) {
    throw std::runtime_error("redis connection failed: out of memory");
  }
  context_.reset(raw);

  if (context_->err != REDIS_OK) {
    const std::string reason = context_->errstr;
    context_.reset();
    throw std::runtime_error("redis connection failed: " + reason);
  }

  if (!options_.password.empty()) {
    const auto reply = command(context_.get(), {"AUTH", options_.password});
    if (reply->type == REDIS_REPLY_ERROR) {
      context_.reset();
      throw std::runtime_error("redis AUTH failed");
    }
  }

  if (options_.db != 0) {
    const auto reply = command(context_.get(), {"SELECT", std::to_string(options_.db)});
    if (reply->type == REDIS_REPLY_ERROR) {
      context_.reset();
      throw std::runtime_error("redis SELECT failed");
    }
  }
}

std::vector<std::string> RedisTsSampleStore::list_nodes() {
  ensure_connected();

  const std::string head = options_.key_prefix + ":";
  const std::string tail = ":vcpus_total";
  const auto reply = command(context_.get(), {"KEYS", head + "*" + tail});
  if (reply->type == REDIS_REPLY_ERROR) {
    throw std::runtime_error("failed to list sample keys");
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw std::runtime_error("unexpected response from KEYS");
  }

  std::vector<std::string> nodes;
  nodes.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const auto* element = reply->element[i];
    if (element == nullptr || element->type != REDIS_REPLY_STRING || element->str == nullptr) {
      continue;
    }
    const std::string key(element->str, static_cast<std::size_t>(element->len));
    if (key.size() <= head.size() + tail.size() || key.rfind(head, 0) != 0) {
      continue;
    }
    nodes.push_back(key.substr(head.size(), key.size() - head.size() - tail.size()));
  }

  std::sort(nodes.begin(), nodes.end());
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
  return nodes;
}

std::vector<model::RawSample> RedisTsSampleStore::get_window(const std::string& node, const std::int64_t start_ms,
                                                             const std::int64_t end_ms) {
  ensure_connected();

  std::map<std::int64_t, model::RawSample> by_timestamp;
  for (const auto& field : field_names()) {
    const std::string key = options_.key_prefix + ":" + node + ":" + field;
    const auto reply =
        command(context_.get(), {"TS.RANGE", key, std::to_string(start_ms), std::to_string(end_ms)});

    if (missing_key_error(*reply)) {
      continue;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
      throw std::runtime_error(std::string("TS.RANGE failed for key ") + key);
    }
    if (reply->type != REDIS_REPLY_ARRAY) {
      throw std::runtime_error(std::string("unexpected TS.RANGE response for key ") + key);
    }

    for (std::size_t i = 0; i < reply->elements; ++i) {
      const auto* point = reply->element[i];
      if (point == nullptr || point->type != REDIS_REPLY_ARRAY || point->elements != 2) {
        continue;
      }
      const auto timestamp = reply_timestamp(point->element[0]);
      const auto value = reply_value(point->element[1]);
      if (!timestamp.has_value() || !value.has_value()) {
        continue;
      }

      auto& sample = by_timestamp[*timestamp];
      sample.timestamp_ms = *timestamp;
      sample.node = node;
      assign_field(sample, field, *value);
    }
  }

  std::vector<model::RawSample> window;
  window.reserve(by_timestamp.size());
  for (auto& [timestamp, sample] : by_timestamp) {
    window.push_back(std::move(sample));
  }
  return window;
}

}  // namespace capacity_planner::store
