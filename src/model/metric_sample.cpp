#include "model/metric_sample.hpp"

#include <cmath>
#include <limits>

#include "core/errors.hpp"

namespace capacity_planner::model {

namespace {

template <typename T>
const T& require(const std::optional<T>& field, const char* name) {
  if (!field.has_value()) {
    throw core::MissingData(std::string("sample is missing required field ") + name);
  }
  return *field;
}

std::uint32_t require_count(const std::optional<std::int64_t>& field, const char* name) {
  const std::int64_t value = require(field, name);
  if (value < 0) {
    throw core::DataQualityError(std::string(name) + " must not be negative");
  }
  if (value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw core::DataQualityError(std::string(name) + " is out of range");
  }
  return static_cast<std::uint32_t>(value);
}

double require_amount(const std::optional<double>& field, const char* name) {
  const double value = require(field, name);
  if (!std::isfinite(value)) {
    throw core::DataQualityError(std::string(name) + " must be finite");
  }
  if (value < 0.0) {
    throw core::DataQualityError(std::string(name) + " must not be negative");
  }
  return value;
}

void check_used_total(const double used, const double total, const char* resource) {
  if (used > total) {
    throw core::DataQualityError(std::string(resource) + " used exceeds total");
  }
}

double percent(const double used, const double total) noexcept {
  return total > 0.0 ? (used / total) * 100.0 : 0.0;
}

}  // namespace

MetricSample::MetricSample(const RawSample& raw)
    : timestamp_ms_(require(raw.timestamp_ms, "timestamp")),
      node_(require(raw.node, "node")),
      vcpus_used_(require_count(raw.vcpus_used, "vcpus_used")),
      vcpus_total_(require_count(raw.vcpus_total, "vcpus_total")),
      memory_used_mb_(require_amount(raw.memory_used_mb, "memory_used_mb")),
      memory_total_mb_(require_amount(raw.memory_total_mb, "memory_total_mb")),
      disk_used_gb_(require_amount(raw.disk_used_gb, "disk_used_gb")),
      disk_total_gb_(require_amount(raw.disk_total_gb, "disk_total_gb")),
      instances_(require_count(raw.instances, "instances")),
      hypervisor_type_(raw.hypervisor_type.value_or("unknown")),
      state_(raw.state.value_or("unknown")),
      status_(raw.status.value_or("unknown")) {
  if (node_.empty()) {
    throw core::MissingData("sample node identifier is empty");
  }

  check_used_total(vcpus_used_, vcpus_total_, "vcpus");
  check_used_total(memory_used_mb_, memory_total_mb_, "memory");
  check_used_total(disk_used_gb_, disk_total_gb_, "disk");

  utilization_[index_of(Resource::CPU)] = percent(vcpus_used_, vcpus_total_);
  utilization_[index_of(Resource::MEMORY)] = percent(memory_used_mb_, memory_total_mb_);
  utilization_[index_of(Resource::DISK)] = percent(disk_used_gb_, disk_total_gb_);

  zero_total_[index_of(Resource::CPU)] = vcpus_total_ == 0;
  zero_total_[index_of(Resource::MEMORY)] = memory_total_mb_ == 0.0;
  zero_total_[index_of(Resource::DISK)] = disk_total_gb_ == 0.0;
}

bool MetricSample::has_data_quality_warning() const noexcept {
  for (const bool flag : zero_total_) {
    if (flag) {
      return true;
    }
  }
  return false;
}

}  // namespace capacity_planner::model
