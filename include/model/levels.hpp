#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace capacity_planner::model {

enum class Resource : std::uint8_t {
  CPU = 0,
  MEMORY = 1,
  DISK = 2,
};

inline constexpr std::size_t kResourceCount = 3;
inline constexpr std::array<Resource, kResourceCount> kResources = {Resource::CPU, Resource::MEMORY, Resource::DISK};

inline constexpr std::size_t index_of(const Resource resource) noexcept {
  return static_cast<std::size_t>(resource);
}

// Current state of a resource, from the latest sample.
enum class RiskLevel : std::uint8_t {
  HEALTHY = 0,
  WARNING = 1,
  CRITICAL = 2,
};

// Sustained state of a resource, from the window mean.
enum class UsageRisk : std::uint8_t {
  LOW = 0,
  MEDIUM = 1,
  HIGH = 2,
};

enum class Severity : std::uint8_t {
  MEDIUM = 0,
  HIGH = 1,
  CRITICAL = 2,
};

template <typename Level>
using PerResource = std::array<Level, kResourceCount>;

const char* to_string(Resource resource) noexcept;
const char* to_string(RiskLevel level) noexcept;
const char* to_string(UsageRisk level) noexcept;
const char* to_string(Severity severity) noexcept;

// "cpu_utilization", "memory_utilization", "disk_utilization"
const char* metric_name(Resource resource) noexcept;

}  // namespace capacity_planner::model
