#include "core/math.hpp"

#include <cmath>
#include <stdexcept>

namespace capacity_planner::core {

double mean(const std::vector<double>& values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const double value : values) {
    sum += value;
  }
  return sum / static_cast<double>(values.size());
}

double sample_variance(const std::vector<double>& values) noexcept {
  if (values.size() < 2) {
    return 0.0;
  }
  const double mu = mean(values);
  double sum_sq = 0.0;
  for (const double value : values) {
    const double deviation = value - mu;
    sum_sq += deviation * deviation;
  }
  return sum_sq / static_cast<double>(values.size() - 1);
}

double sample_stddev(const std::vector<double>& values) noexcept {
  return std::sqrt(sample_variance(values));
}

double median(std::vector<double> values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  const std::size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
  const double upper = values[mid];
  if (values.size() % 2 == 1) {
    return upper;
  }
  const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
  return (lower + upper) / 2.0;
}

LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y) noexcept {
  LinearFit fit{};
  const std::size_t n = std::min(x.size(), y.size());
  if (n == 0) {
    return fit;
  }

  double x_sum = 0.0;
  double y_sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    x_sum += x[i];
    y_sum += y[i];
  }
  fit.x_mean = x_sum / static_cast<double>(n);
  const double y_mean = y_sum / static_cast<double>(n);

  double sxy = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = x[i] - fit.x_mean;
    fit.sxx += dx * dx;
    sxy += dx * (y[i] - y_mean);
  }

  fit.slope = fit.sxx > 0.0 ? sxy / fit.sxx : 0.0;
  fit.intercept = y_mean - (fit.slope * fit.x_mean);

  for (std::size_t i = 0; i < n; ++i) {
    const double residual = y[i] - (fit.intercept + (fit.slope * x[i]));
    fit.residual_sum_squares += residual * residual;
  }
  return fit;
}

double normal_quantile(const double p) {
  if (!(p > 0.0 && p < 1.0)) {
    throw std::domain_error("normal_quantile requires p in (0, 1)");
  }

  // Acklam's rational approximation, relative error below 1.2e-9.
  constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                          1.383577518672690e+02,  -3.066479806614716e+01, 2.506628277459239e+00};
  constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                          6.680131188771972e+01,  -1.328068155288572e+01};
  constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                          -2.549732539343734e+00, 4.374664141464968e+00,  2.938163982698783e+00};
  constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                          3.754408661907416e+00};
  constexpr double p_low = 0.02425;
  constexpr double p_high = 1.0 - p_low;

  if (p < p_low) {
    const double q = std::sqrt(-2.0 * std::log(p));
    return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
           ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }
  if (p > p_high) {
    const double q = std::sqrt(-2.0 * std::log(1.0 - p));
    return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
           ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
  }

  const double q = p - 0.5;
  const double r = q * q;
  return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
         (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

double two_sided_z(const double confidence) {
  return normal_quantile(0.5 + (confidence / 2.0));
}

}  // namespace capacity_planner::core
