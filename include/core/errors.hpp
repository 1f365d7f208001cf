#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace capacity_planner::core {

// Required field absent or unparseable.
class MissingData : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Values present but inconsistent: used > total, negative counts, non-finite numbers,
// non-monotonic or duplicate timestamps.
class DataQualityError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidSeries : public DataQualityError {
 public:
  using DataQualityError::DataQualityError;
};

class InsufficientHistory : public std::runtime_error {
 public:
  InsufficientHistory(const std::string& what, std::size_t available, std::size_t required)
      : std::runtime_error(what), available_(available), required_(required) {}

  std::size_t available() const noexcept { return available_; }
  std::size_t required() const noexcept { return required_; }

 private:
  std::size_t available_;
  std::size_t required_;
};

class InvalidConfiguration : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A forecast model returned the wrong number of points, non-finite values, a forecast
// outside its bounds, or bounds that narrow with the step.
class ForecastModelError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace capacity_planner::core
