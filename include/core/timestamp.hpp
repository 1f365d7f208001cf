#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace capacity_planner::core {

inline constexpr std::int64_t kMillisPerHour = 3'600'000;

inline std::int64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// Accepts "YYYY-MM-DD[T| ]HH:MM:SS[.fraction][Z]" interpreted as UTC.
std::optional<std::int64_t> parse_iso8601_ms(const std::string& text);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string format_iso8601(std::int64_t timestamp_ms);

}  // namespace capacity_planner::core
