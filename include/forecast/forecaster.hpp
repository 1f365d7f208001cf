#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/sample_window.hpp"
#include "forecast/forecast_model.hpp"
#include "model/forecast_point.hpp"
#include "model/levels.hpp"

namespace capacity_planner::forecast {

struct ForecastOptions {
  std::size_t horizon_points{24};
  double confidence{0.8};
  std::size_t min_history_for_forecast{10};
  std::size_t min_history_for_seasonal{48};
  std::size_t season_length{24};
  std::size_t backtest_points{24};
  // Points further than this many standard deviations from the series mean are dropped
  // before fitting. 0 disables trimming.
  double outlier_k_sigma{3.0};
};

// Throws core::InvalidConfiguration.
void validate(const ForecastOptions& options);

struct ForecastRun {
  model::ModelType model{model::ModelType::NAIVE_TREND};
  std::vector<model::ForecastPoint> points{};
  // Points the model was fitted on, after trimming.
  std::size_t history_size{0};
  std::size_t outliers_removed{0};
  std::int64_t step_ms{0};
  // Why the seasonal model was not used, when it was not.
  std::optional<std::string> fallback_reason{};
};

struct AccuracyMetrics {
  double mae{0.0};
  double rmse{0.0};
  // Absent when every actual value is 0.
  std::optional<double> mape{};
  std::size_t points{0};
};

// actual and predicted must have the same, non-zero size.
AccuracyMetrics accuracy_metrics(const std::vector<double>& actual, const std::vector<double>& predicted);

struct BacktestResult {
  model::ModelType model{model::ModelType::NAIVE_TREND};
  std::size_t training_size{0};
  std::size_t holdout{0};
  AccuracyMetrics accuracy{};
  std::vector<double> predicted{};
  std::vector<double> actual{};
};

// Throws core::InvalidSeries on non-finite values or timestamps that do not strictly increase.
void validate_series(const Series& series);

// Median spacing of consecutive points. Series must hold at least two points.
std::int64_t native_step_ms(const Series& series);

Series to_series(const core::SampleWindow& window, model::Resource resource);

class Forecaster {
 public:
  explicit Forecaster(ForecastOptions options = {}, std::unique_ptr<ForecastModel> custom = nullptr);

  // Throws core::InsufficientHistory below min_history_for_forecast (before or after outlier
  // trimming), core::InvalidSeries for a malformed series and core::ForecastModelError when
  // the selected model breaks the point contract. Never returns a partial run.
  ForecastRun forecast(const Series& series) const;

  // Withholds the last backtest_points (fewer when the training part would fall below the
  // forecast minimum) and scores a forecast of them.
  BacktestResult backtest(const Series& series) const;
  BacktestResult backtest(const Series& series, std::size_t holdout) const;

  const ForecastOptions& options() const noexcept { return options_; }

 private:
  struct Selection {
    const ForecastModel* model{nullptr};
    std::optional<std::string> fallback_reason{};
  };

  Selection select_model(std::size_t history_size) const;
  ForecastRun run(const Series& series, std::size_t horizon) const;

  ForecastOptions options_;
  std::unique_ptr<ForecastModel> custom_;
  std::unique_ptr<ForecastModel> seasonal_;
  std::unique_ptr<ForecastModel> naive_;
};

}  // namespace capacity_planner::forecast
