#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "model/levels.hpp"

namespace capacity_planner::model {

// Unvalidated observation as delivered by a sample store. Absent fields stay empty.
struct RawSample {
  std::optional<std::int64_t> timestamp_ms{};
  std::optional<std::string> node{};
  std::optional<std::int64_t> vcpus_used{};
  std::optional<std::int64_t> vcpus_total{};
  std::optional<double> memory_used_mb{};
  std::optional<double> memory_total_mb{};
  std::optional<double> disk_used_gb{};
  std::optional<double> disk_total_gb{};
  std::optional<std::int64_t> instances{};
  std::optional<std::string> hypervisor_type{};
  std::optional<std::string> state{};
  std::optional<std::string> status{};
};

// Samples dropped from a window, by cause.
struct ExclusionCounts {
  std::size_t missing_data{0};
  std::size_t data_quality{0};
  std::size_t foreign_node{0};
  std::size_t out_of_order{0};

  std::size_t total() const noexcept { return missing_data + data_quality + foreign_node + out_of_order; }
};

// One validated observation of one node. Utilization is always derived from used/total.
class MetricSample {
 public:
  // Throws core::MissingData when a required field is absent and core::DataQualityError
  // when values are inconsistent (used > total, negative, non-finite).
  explicit MetricSample(const RawSample& raw);

  std::int64_t timestamp_ms() const noexcept { return timestamp_ms_; }
  const std::string& node() const noexcept { return node_; }

  std::uint32_t vcpus_used() const noexcept { return vcpus_used_; }
  std::uint32_t vcpus_total() const noexcept { return vcpus_total_; }
  double memory_used_mb() const noexcept { return memory_used_mb_; }
  double memory_total_mb() const noexcept { return memory_total_mb_; }
  double disk_used_gb() const noexcept { return disk_used_gb_; }
  double disk_total_gb() const noexcept { return disk_total_gb_; }
  std::uint32_t instances() const noexcept { return instances_; }

  const std::string& hypervisor_type() const noexcept { return hypervisor_type_; }
  const std::string& state() const noexcept { return state_; }
  const std::string& status() const noexcept { return status_; }

  // Percent in [0, 100]; 0 when the resource total is 0.
  double utilization(Resource resource) const noexcept { return utilization_[index_of(resource)]; }

  // Set when the resource reports a total of 0.
  bool zero_total(Resource resource) const noexcept { return zero_total_[index_of(resource)]; }
  bool has_data_quality_warning() const noexcept;

 private:
  std::int64_t timestamp_ms_{0};
  std::string node_{};
  std::uint32_t vcpus_used_{0};
  std::uint32_t vcpus_total_{0};
  double memory_used_mb_{0.0};
  double memory_total_mb_{0.0};
  double disk_used_gb_{0.0};
  double disk_total_gb_{0.0};
  std::uint32_t instances_{0};
  std::string hypervisor_type_{};
  std::string state_{};
  std::string status_{};
  PerResource<double> utilization_{};
  PerResource<bool> zero_total_{};
};

}  // namespace capacity_planner::model
