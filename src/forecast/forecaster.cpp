#include "forecast/forecaster.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace capacity_planner::forecast {
namespace {

Series trim_outliers(const Series& series, const double k_sigma) {
  if (k_sigma <= 0.0) {
    return series;
  }
  std::vector<double> values;
  values.reserve(series.size());
  for (const auto& point : series) {
    values.push_back(point.value);
  }
  const double center = core::mean(values);
  const double limit = k_sigma * core::sample_stddev(values);
  if (!(limit > 0.0)) {
    return series;
  }

  Series kept;
  kept.reserve(series.size());
  for (const auto& point : series) {
    if (std::fabs(point.value - center) <= limit) {
      kept.push_back(point);
    }
  }
  return kept;
}

void check_points(const std::vector<model::ForecastPoint>& points, const std::size_t horizon,
                  const model::ModelType type) {
  const std::string name(model::to_string(type));
  if (points.size() != horizon) {
    throw core::ForecastModelError(name + " model returned " + std::to_string(points.size()) +
                                   " points for a horizon of " + std::to_string(horizon));
  }

  double previous_width = 0.0;
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& point = points[i];
    const std::string at = " at step " + std::to_string(i + 1);
    if (!std::isfinite(point.forecast) || !std::isfinite(point.lower_bound) || !std::isfinite(point.upper_bound)) {
      throw core::ForecastModelError(name + " model returned a non-finite value" + at);
    }
    if (!(point.lower_bound <= point.forecast && point.forecast <= point.upper_bound)) {
      throw core::ForecastModelError(name + " model put the forecast outside its lower bound/upper bound" + at);
    }
    if (i > 0 && point.width() < previous_width) {
      throw core::ForecastModelError(name + " model returned bounds that narrow" + at);
    }
    previous_width = point.width();
  }
}

}  // namespace

void validate(const ForecastOptions& options) {
  if (options.horizon_points < 1) {
    throw core::InvalidConfiguration("forecast_horizon_points must be at least 1");
  }
  if (!std::isfinite(options.confidence) || options.confidence <= 0.0 || options.confidence >= 1.0) {
    throw core::InvalidConfiguration("forecast_confidence must be in (0, 1)");
  }
  if (options.season_length < 2) {
    throw core::InvalidConfiguration("forecast.season_length must be at least 2");
  }
  if (options.min_history_for_forecast < 2) {
    throw core::InvalidConfiguration("min_history_for_forecast must be at least 2");
  }
  if (options.backtest_points < 1) {
    throw core::InvalidConfiguration("forecast.backtest_points must be at least 1");
  }
  if (!std::isfinite(options.outlier_k_sigma) || options.outlier_k_sigma < 0.0) {
    throw core::InvalidConfiguration("forecast.outlier_k_sigma must be 0 or greater");
  }
}

AccuracyMetrics accuracy_metrics(const std::vector<double>& actual, const std::vector<double>& predicted) {
  if (actual.empty() || actual.size() != predicted.size()) {
    throw std::invalid_argument("accuracy_metrics needs equally sized, non-empty vectors");
  }

  double abs_sum = 0.0;
  double sq_sum = 0.0;
  double pct_sum = 0.0;
  std::size_t pct_count = 0;
  for (std::size_t i = 0; i < actual.size(); ++i) {
    const double error = predicted[i] - actual[i];
    abs_sum += std::fabs(error);
    sq_sum += error * error;
    if (actual[i] != 0.0) {
      pct_sum += std::fabs(error / actual[i]);
      ++pct_count;
    }
  }

  const auto n = static_cast<double>(actual.size());
  AccuracyMetrics metrics{};
  metrics.mae = abs_sum / n;
  metrics.rmse = std::sqrt(sq_sum / n);
  if (pct_count > 0) {
    metrics.mape = 100.0 * pct_sum / static_cast<double>(pct_count);
  }
  metrics.points = actual.size();
  return metrics;
}

void validate_series(const Series& series) {
  for (std::size_t i = 0; i < series.size(); ++i) {
    if (!std::isfinite(series[i].value)) {
      throw core::InvalidSeries("non-finite value at index " + std::to_string(i));
    }
    if (i > 0 && series[i].timestamp_ms <= series[i - 1].timestamp_ms) {
      const char* kind = series[i].timestamp_ms == series[i - 1].timestamp_ms ? "duplicate" : "non-monotonic";
      throw core::InvalidSeries(std::string(kind) + " timestamp " + std::to_string(series[i].timestamp_ms));
    }
  }
}

std::int64_t native_step_ms(const Series& series) {
  if (series.size() < 2) {
    throw core::InsufficientHistory("native step needs two points", series.size(), 2);
  }
  std::vector<double> gaps;
  gaps.reserve(series.size() - 1);
  for (std::size_t i = 1; i < series.size(); ++i) {
    gaps.push_back(static_cast<double>(series[i].timestamp_ms - series[i - 1].timestamp_ms));
  }
  return std::max<std::int64_t>(1, static_cast<std::int64_t>(std::llround(core::median(std::move(gaps)))));
}

Series to_series(const core::SampleWindow& window, const model::Resource resource) {
  Series series;
  series.reserve(window.size());
  for (const auto& sample : window.samples) {
    series.push_back(SeriesPoint{sample.timestamp_ms(), sample.utilization(resource)});
  }
  return series;
}

Forecaster::Forecaster(ForecastOptions options, std::unique_ptr<ForecastModel> custom)
    : options_(options),
      custom_(std::move(custom)),
      seasonal_(make_seasonal_decomposition_model(options.season_length)),
      naive_(make_naive_trend_model()) {
  validate(options_);
}

Forecaster::Selection Forecaster::select_model(const std::size_t history_size) const {
  std::string prefix;
  if (custom_ != nullptr) {
    if (history_size >= custom_->min_history()) {
      return Selection{custom_.get(), std::nullopt};
    }
    prefix = "custom model needs " + std::to_string(custom_->min_history()) + " points; ";
  }

  const std::size_t seasonal_minimum =
      std::max({options_.min_history_for_seasonal, 2 * options_.season_length, seasonal_->min_history()});
  if (history_size >= seasonal_minimum) {
    if (prefix.empty()) {
      return Selection{seasonal_.get(), std::nullopt};
    }
    return Selection{seasonal_.get(), prefix.substr(0, prefix.size() - 2)};
  }

  return Selection{naive_.get(), prefix + "history of " + std::to_string(history_size) +
                                     " points is below the seasonal minimum of " +
                                     std::to_string(seasonal_minimum)};
}

ForecastRun Forecaster::run(const Series& series, const std::size_t horizon) const {
  validate_series(series);
  const std::size_t minimum = options_.min_history_for_forecast;
  if (series.size() < minimum) {
    throw core::InsufficientHistory("history of " + std::to_string(series.size()) + " points, need " +
                                        std::to_string(minimum),
                                    series.size(), minimum);
  }

  const std::int64_t step_ms = native_step_ms(series);
  const Series history = trim_outliers(series, options_.outlier_k_sigma);
  const std::size_t removed = series.size() - history.size();
  if (history.size() < minimum) {
    throw core::InsufficientHistory("history of " + std::to_string(history.size()) + " points after trimming " +
                                        std::to_string(removed) + " outliers, need " + std::to_string(minimum),
                                    history.size(), minimum);
  }

  const Selection selection = select_model(history.size());
  ModelRequest request{};
  request.anchor_ms = series.back().timestamp_ms;
  request.step_ms = step_ms;
  request.horizon = horizon;
  request.confidence = options_.confidence;

  ForecastRun result{};
  result.model = selection.model->type();
  result.points = selection.model->predict(history, request);
  check_points(result.points, horizon, result.model);
  result.history_size = history.size();
  result.outliers_removed = removed;
  result.step_ms = step_ms;
  result.fallback_reason = selection.fallback_reason;
  return result;
}

ForecastRun Forecaster::forecast(const Series& series) const { return run(series, options_.horizon_points); }

BacktestResult Forecaster::backtest(const Series& series) const { return backtest(series, options_.backtest_points); }

BacktestResult Forecaster::backtest(const Series& series, const std::size_t holdout) const {
  validate_series(series);
  const std::size_t minimum = options_.min_history_for_forecast;
  if (holdout < 1 || series.size() < minimum + 1) {
    throw core::InsufficientHistory("backtest needs " + std::to_string(minimum + 1) + " points, have " +
                                        std::to_string(series.size()),
                                    series.size(), minimum + 1);
  }

  const std::size_t withheld = std::min(holdout, series.size() - minimum);
  const Series training(series.begin(), series.end() - static_cast<std::ptrdiff_t>(withheld));
  const ForecastRun forecast_run = run(training, withheld);

  BacktestResult result{};
  result.model = forecast_run.model;
  result.training_size = training.size();
  result.holdout = withheld;
  result.actual.reserve(withheld);
  result.predicted.reserve(withheld);
  for (std::size_t i = 0; i < withheld; ++i) {
    result.actual.push_back(series[training.size() + i].value);
    result.predicted.push_back(forecast_run.points[i].forecast);
  }
  result.accuracy = accuracy_metrics(result.actual, result.predicted);
  return result;
}

}  // namespace capacity_planner::forecast
