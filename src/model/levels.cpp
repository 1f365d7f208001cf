#include "model/levels.hpp"

#include "model/forecast_point.hpp"

namespace capacity_planner::model {

const char* to_string(const Resource resource) noexcept {
  switch (resource) {
    case Resource::CPU:
      return "cpu";
    case Resource::MEMORY:
      return "memory";
    case Resource::DISK:
      return "disk";
  }
  return "unknown";
}

const char* to_string(const RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::HEALTHY:
      return "Healthy";
    case RiskLevel::WARNING:
      return "Warning";
    case RiskLevel::CRITICAL:
      return "Critical";
  }
  return "unknown";
}

const char* to_string(const UsageRisk level) noexcept {
  switch (level) {
    case UsageRisk::LOW:
      return "Low";
    case UsageRisk::MEDIUM:
      return "Medium";
    case UsageRisk::HIGH:
      return "High";
  }
  return "unknown";
}

const char* to_string(const Severity severity) noexcept {
  switch (severity) {
    case Severity::MEDIUM:
      return "Medium";
    case Severity::HIGH:
      return "High";
    case Severity::CRITICAL:
      return "Critical";
  }
  return "unknown";
}

const char* metric_name(const Resource resource) noexcept {
  switch (resource) {
    case Resource::CPU:
      return "cpu_utilization";
    case Resource::MEMORY:
      return "memory_utilization";
    case Resource::DISK:
      return "disk_utilization";
  }
  return "unknown";
}

const char* to_string(const ModelType type) noexcept {
  switch (type) {
    case ModelType::SEASONAL_DECOMPOSITION:
      return "seasonal_decomposition";
    case ModelType::NAIVE_TREND:
      return "naive_trend";
    case ModelType::CUSTOM:
      return "custom";
  }
  return "unknown";
}

}  // namespace capacity_planner::model
