#pragma once

#include "quant-forecast/core/method.hpp"
#include "quant-forecast/utils/metrics.hpp"

#include <string>
#include <vector>

namespace quantforecast::engine {

/**
 * @brief Everything a caller needs to present a forecast.
 *
 * forecast_values, forecast_dates, confidence_lower and confidence_upper all
 * hold forecast_horizon entries, and confidence_lower[i] <= forecast_values[i]
 * <= confidence_upper[i] for every step.
 */
struct ForecastResult {
	core::MethodVariant method = core::MethodVariant::LinearRegression;
	std::vector<double> forecast_values;
	/// YYYY-MM-DD, one period apart starting one period after the last observation.
	std::vector<std::string> forecast_dates;
	std::vector<double> confidence_upper;
	std::vector<double> confidence_lower;
	utils::AccuracyMetrics accuracy_metrics;
	bool seasonal_detected = false;
	core::TrendDirection trend_direction = core::TrendDirection::Stable;
	double last_actual_value = 0.0;
	int forecast_horizon = 0;
};

} // namespace quantforecast::engine
