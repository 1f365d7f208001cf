#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/math.hpp"
#include "model/forecast_point.hpp"

namespace capacity_planner::forecast {

struct SeriesPoint {
  std::int64_t timestamp_ms{0};
  double value{0.0};
};

using Series = std::vector<SeriesPoint>;

struct ModelRequest {
  // Last observed timestamp. Forecasts start one step after it; the history may end
  // earlier when trailing outliers were trimmed.
  std::int64_t anchor_ms{0};
  std::int64_t step_ms{0};
  std::size_t horizon{0};
  double confidence{0.8};
};

// A forecasting method. Callers guarantee the history is validated, strictly ascending,
// at least min_history() long, that step_ms > 0 and that anchor_ms is not before the last
// history point. The forecaster rejects output that breaks the ForecastPoint invariants.
class ForecastModel {
 public:
  virtual model::ModelType type() const = 0;
  virtual std::size_t min_history() const = 0;
  // Bounds must widen (never narrow) with the step.
  virtual std::vector<model::ForecastPoint> predict(const Series& history, const ModelRequest& request) const = 0;
  virtual ~ForecastModel() = default;
};

std::unique_ptr<ForecastModel> make_seasonal_decomposition_model(std::size_t season_length);
std::unique_ptr<ForecastModel> make_naive_trend_model();

// Position of every point in units of step_ms, relative to the first point.
std::vector<double> step_positions(const Series& history, std::int64_t step_ms);

// Spread per step that does not depend on the fit: 1% of the mean magnitude of the history,
// never below 0.01.
double baseline_sigma(const Series& history) noexcept;

// Half width at position x, step steps past the anchor: the regression prediction interval
// plus a baseline term growing with sqrt(step). Strictly increases with step.
double prediction_half_width(double z, double sigma, double baseline, std::size_t n, const core::LinearFit& fit,
                             double x, std::size_t step) noexcept;

}  // namespace capacity_planner::forecast
