#include "store/json_store.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"

namespace capacity_planner::store {
namespace {

// 2^63; whole doubles outside [-2^63, 2^63) do not fit std::int64_t.
constexpr double kInt64Limit = 9223372036854775808.0;

std::optional<std::int64_t> integer_field(const nlohmann::json& record, const char* name) {
  const auto it = record.find(name);
  if (it == record.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_number_float()) {
    const double value = it->get<double>();
    if (std::isfinite(value) && std::floor(value) == value && value >= -kInt64Limit && value < kInt64Limit) {
      return static_cast<std::int64_t>(value);
    }
  }
  return std::nullopt;
}

std::optional<double> number_field(const nlohmann::json& record, const char* name) {
  const auto it = record.find(name);
  if (it == record.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

std::optional<std::string> string_field(const nlohmann::json& record, const char* name) {
  const auto it = record.find(name);
  if (it == record.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<std::int64_t> timestamp_field(const nlohmann::json& record) {
  const auto it = record.find("timestamp");
  if (it == record.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return core::parse_iso8601_ms(it->get<std::string>());
  }
  return integer_field(record, "timestamp");
}

}  // namespace

model::RawSample sample_from_json(const nlohmann::json& record) {
  model::RawSample sample{};
  sample.timestamp_ms = timestamp_field(record);
  sample.node = string_field(record, "node");
  sample.vcpus_used = integer_field(record, "vcpus_used");
  sample.vcpus_total = integer_field(record, "vcpus_total");
  sample.memory_used_mb = number_field(record, "memory_used_mb");
  sample.memory_total_mb = number_field(record, "memory_total_mb");
  sample.disk_used_gb = number_field(record, "disk_used_gb");
  sample.disk_total_gb = number_field(record, "disk_total_gb");
  sample.instances = integer_field(record, "instances");
  sample.hypervisor_type = string_field(record, "hypervisor_type");
  sample.state = string_field(record, "state");
  sample.status = string_field(record, "status");
  return sample;
}

std::vector<model::RawSample> parse_sample_records(std::istream& input) {
  nlohmann::json document;
  try {
    input >> document;
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error(std::string("invalid sample json: ") + ex.what());
  }

  if (!document.is_array()) {
    throw std::runtime_error("sample json must be an array of records");
  }

  std::vector<model::RawSample> samples;
  samples.reserve(document.size());
  for (std::size_t i = 0; i < document.size(); ++i) {
    if (!document[i].is_object()) {
      throw std::runtime_error("sample record " + std::to_string(i) + " is not an object");
    }
    samples.push_back(sample_from_json(document[i]));
  }
  return samples;
}

std::unique_ptr<MemorySampleStore> load_json_store(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open sample file: " + path);
  }

  auto store = std::make_unique<MemorySampleStore>();
  std::size_t unassigned = 0;
  for (auto& sample : parse_sample_records(input)) {
    if (!sample.node.has_value() || sample.node->empty()) {
      ++unassigned;
      continue;
    }
    store->append(std::move(sample));
  }

  std::cerr << "[store] loaded " << store->size() << " samples from " << path << '\n';
  if (unassigned > 0) {
    std::cerr << "[store] skipped " << unassigned << " records without a node\n";
  }
  return store;
}

}  // namespace capacity_planner::store
