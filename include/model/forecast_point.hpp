#pragma once

#include <cstddef>
#include <cstdint>

namespace capacity_planner::model {

enum class ModelType : std::uint8_t {
  SEASONAL_DECOMPOSITION = 0,
  NAIVE_TREND = 1,
  CUSTOM = 2,
};

const char* to_string(ModelType type) noexcept;

// lower_bound <= forecast <= upper_bound holds for every point.
struct ForecastPoint {
  std::int64_t timestamp_ms{0};
  // 1-based position in the horizon.
  std::size_t step{0};
  double forecast{0.0};
  double lower_bound{0.0};
  double upper_bound{0.0};
  double confidence{0.0};
  ModelType model_type{ModelType::NAIVE_TREND};

  double width() const noexcept { return upper_bound - lower_bound; }
};

}  // namespace capacity_planner::model
