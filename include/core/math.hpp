#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace capacity_planner::core {

inline constexpr double clamp_percent(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

struct LinearFit {
  double intercept{0.0};
  double slope{0.0};
  double x_mean{0.0};
  // Sum of squared deviations of x around x_mean.
  double sxx{0.0};
  double residual_sum_squares{0.0};
};

double mean(const std::vector<double>& values) noexcept;

// Unbiased (n - 1) variance. Returns 0 for fewer than two values.
double sample_variance(const std::vector<double>& values) noexcept;

double sample_stddev(const std::vector<double>& values) noexcept;

double median(std::vector<double> values) noexcept;

// Least squares y = intercept + slope * x. x and y must have the same size.
LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y) noexcept;

// Inverse of the standard normal CDF for p in (0, 1).
double normal_quantile(double p);

// z such that P(-z < Z < z) = confidence.
double two_sided_z(double confidence);

}  // namespace capacity_planner::core
