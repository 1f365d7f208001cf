#include "forecast/forecast_model.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>

namespace capacity_planner::forecast {

namespace {

std::size_t phase_of(const double position, const std::size_t season_length) noexcept {
  const auto rounded = static_cast<long long>(std::llround(position));
  const auto period = static_cast<long long>(season_length);
  return static_cast<std::size_t>(((rounded % period) + period) % period);
}

// Centered moving average over one season; 2xm average for even season lengths.
std::vector<std::optional<double>> centered_trend(const std::vector<double>& y, const std::size_t m) {
  std::vector<std::optional<double>> trend(y.size());
  const std::size_t half = m / 2;
  if (y.size() < m + 1) {
    return trend;
  }

  for (std::size_t i = half; i + half < y.size(); ++i) {
    double sum = 0.0;
    if (m % 2 == 0) {
      sum += 0.5 * y[i - half];
      sum += 0.5 * y[i + half];
      for (std::size_t j = i - half + 1; j < i + half; ++j) {
        sum += y[j];
      }
    } else {
      for (std::size_t j = i - half; j <= i + half; ++j) {
        sum += y[j];
      }
    }
    trend[i] = sum / static_cast<double>(m);
  }
  return trend;
}

// Classical additive decomposition: seasonal indices from the detrended series, then a
// linear trend through the deseasonalized series. Residual spread drives the bounds.
class SeasonalDecompositionModel final : public ForecastModel {
 public:
  explicit SeasonalDecompositionModel(const std::size_t season_length) : season_length_(season_length) {}

  model::ModelType type() const override { return model::ModelType::SEASONAL_DECOMPOSITION; }

  std::size_t min_history() const override { return 2 * season_length_; }

  std::vector<model::ForecastPoint> predict(const Series& history, const ModelRequest& request) const override {
    const std::size_t m = season_length_;
    const std::size_t n = history.size();
    const std::vector<double> x = step_positions(history, request.step_ms);
    std::vector<double> y;
    y.reserve(n);
    for (const auto& point : history) {
      y.push_back(point.value);
    }

    const auto trend = centered_trend(y, m);
    std::vector<double> phase_sum(m, 0.0);
    std::vector<std::size_t> phase_count(m, 0);
    for (std::size_t i = 0; i < n; ++i) {
      if (!trend[i].has_value()) {
        continue;
      }
      const std::size_t phase = phase_of(x[i], m);
      phase_sum[phase] += y[i] - *trend[i];
      ++phase_count[phase];
    }

    std::vector<double> seasonal(m, 0.0);
    double seasonal_mean = 0.0;
    for (std::size_t p = 0; p < m; ++p) {
      seasonal[p] = phase_count[p] > 0 ? phase_sum[p] / static_cast<double>(phase_count[p]) : 0.0;
      seasonal_mean += seasonal[p];
    }
    seasonal_mean /= static_cast<double>(m);
    for (auto& index : seasonal) {
      index -= seasonal_mean;
    }

    std::vector<double> deseasonalized(n);
    for (std::size_t i = 0; i < n; ++i) {
      deseasonalized[i] = y[i] - seasonal[phase_of(x[i], m)];
    }

    const core::LinearFit fit = core::linear_fit(x, deseasonalized);
    const std::size_t parameters = 2 + (m - 1);
    const std::size_t dof = n > parameters ? n - parameters : 1;
    const double sigma = std::sqrt(fit.residual_sum_squares / static_cast<double>(dof));
    const double z = core::two_sided_z(request.confidence);
    const double baseline = baseline_sigma(history);

    std::vector<model::ForecastPoint> points;
    points.reserve(request.horizon);
    const double last_x =
        static_cast<double>(request.anchor_ms - history.front().timestamp_ms) / static_cast<double>(request.step_ms);
    for (std::size_t step = 1; step <= request.horizon; ++step) {
      const double position = last_x + static_cast<double>(step);
      const double value = fit.intercept + (fit.slope * position) + seasonal[phase_of(position, m)];
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

 private:
  std::size_t season_length_;
};

}  // namespace

std::unique_ptr<ForecastModel> make_seasonal_decomposition_model(const std::size_t season_length) {
  return std::make_unique<SeasonalDecompositionModel>(season_length);
}

}  // namespace capacity_planner::forecast
