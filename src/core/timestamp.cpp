#include "core/timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace capacity_planner::core {

std::optional<std::int64_t> parse_iso8601_ms(const std::string& text) {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  char separator = 0;
  int consumed = 0;

  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &separator, &hour, &minute,
                  &second, &consumed) != 7) {
    return std::nullopt;
  }
  if (separator != 'T' && separator != ' ') {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::int64_t millis = 0;
  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 3) {
        millis = (millis * 10) + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return (static_cast<std::int64_t>(seconds) * 1000) + millis;
}

std::string format_iso8601(const std::int64_t timestamp_ms) {
  std::int64_t seconds = timestamp_ms / 1000;
  if (timestamp_ms < 0 && timestamp_ms % 1000 != 0) {
    --seconds;
  }
  const auto raw = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&raw, &tm);

  char buffer[32]{};
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

}  // namespace capacity_planner::core
