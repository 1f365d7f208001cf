#include "forecast/forecast_model.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

namespace capacity_planner::forecast {

namespace {

// Straight-line extrapolation of the whole history.
class NaiveTrendModel final : public ForecastModel {
 public:
  model::ModelType type() const override { return model::ModelType::NAIVE_TREND; }

  std::size_t min_history() const override { return 2; }

  std::vector<model::ForecastPoint> predict(const Series& history, const ModelRequest& request) const override {
    const std::vector<double> x = step_positions(history, request.step_ms);
    std::vector<double> y;
    y.reserve(history.size());
    for (const auto& point : history) {
      y.push_back(point.value);
    }

    const core::LinearFit fit = core::linear_fit(x, y);
    const std::size_t n = history.size();
    const double sigma = n > 2 ? std::sqrt(fit.residual_sum_squares / static_cast<double>(n - 2)) : 0.0;
    const double z = core::two_sided_z(request.confidence);
    const double baseline = baseline_sigma(history);

    std::vector<model::ForecastPoint> points;
    points.reserve(request.horizon);
    const double last_x =
        static_cast<double>(request.anchor_ms - history.front().timestamp_ms) / static_cast<double>(request.step_ms);
    for (std::size_t step = 1; step <= request.horizon; ++step) {
      const double position = last_x + static_cast<double>(step);
      const double value = fit.intercept + (fit.slope * position);
      const double half = prediction_half_width(z, sigma, baseline, n, fit, position, step);

      model::ForecastPoint point{};
      point.timestamp_ms = request.anchor_ms + (static_cast<std::int64_t>(step) * request.step_ms);
      point.step = step;
      point.forecast = value;
      point.lower_bound = value - half;
      point.upper_bound = value + half;
      point.confidence = request.confidence;
      point.model_type = type();
      points.push_back(point);
    }
    return points;
  }
};

}  // namespace

std::unique_ptr<ForecastModel> make_naive_trend_model() { return std::make_unique<NaiveTrendModel>(); }

std::vector<double> step_positions(const Series& history, const std::int64_t step_ms) {
  std::vector<double> positions;
  positions.reserve(history.size());
  if (history.empty()) {
    return positions;
  }
  const std::int64_t origin = history.front().timestamp_ms;
  for (const auto& point : history) {
    positions.push_back(static_cast<double>(point.timestamp_ms - origin) / static_cast<double>(step_ms));
  }
  return positions;
}

double baseline_sigma(const Series& history) noexcept {
  double magnitude = 0.0;
  for (const auto& point : history) {
    magnitude += std::fabs(point.value);
  }
  if (!history.empty()) {
    magnitude /= static_cast<double>(history.size());
  }
  return std::max(0.01, 0.01 * magnitude);
}

double prediction_half_width(const double z, const double sigma, const double baseline, const std::size_t n,
                             const core::LinearFit& fit, const double x, const std::size_t step) noexcept {
  double spread = 1.0;
  if (n > 0) {
    spread += 1.0 / static_cast<double>(n);
  }
  if (fit.sxx > 0.0) {
    const double dx = x - fit.x_mean;
    spread += (dx * dx) / fit.sxx;
  }
  const double variance = (sigma * sigma * spread) + (baseline * baseline * static_cast<double>(step));
  return z * std::sqrt(variance);
}

}  // namespace capacity_planner::forecast
