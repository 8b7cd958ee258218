#pragma once

#include <cstddef>

namespace quantforecast::core {

/**
 * @struct ForecastConfig
 * @brief Per-call tuning of the forecasting pipeline.
 *
 * Every threshold and smoothing parameter used by the pipeline lives here so
 * that calls are reentrant and each stage can be exercised in isolation.
 */
struct ForecastConfig {
	/// Level smoothing weight for both exponential smoothing methods.
	double alpha = 0.3;
	/// Trend smoothing weight for Holt's method.
	double beta = 0.1;

	/// Rows required in the input table, and usable rows after cleaning.
	/// At least 2, since a trend line needs two points.
	std::size_t min_data_points = 3;
	/// Requested horizons are clamped to this many periods.
	int max_forecast_horizon = 12;

	/// Upper bound of the seasonal cycle; the cycle is min(this, n / 2).
	std::size_t max_season_length = 12;

	/// |corr(index, value)| above this marks the series as trending.
	double trend_correlation_threshold = 0.3;
	/// Series at least this long are treated as seasonal.
	std::size_t seasonality_min_length = 12;
	/// Tukey fence multiplier for outlier counting.
	double outlier_iqr_multiplier = 1.5;

	/// Series shorter than this always use linear regression.
	std::size_t min_length_for_smoothing = 6;
	/// Trending series below this volatility use Holt's method.
	double volatility_threshold = 50.0;

	/// Days between consecutive forecast dates.
	int period_days = 30;

	/**
	 * @brief Checks the configuration for values no stage can work with.
	 * @throws std::invalid_argument describing the first offending field.
	 */
	void validate() const;
};

} // namespace quantforecast::core
