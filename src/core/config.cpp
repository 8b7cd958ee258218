#include "quant-forecast/core/config.hpp"

#include <cmath>
#include <stdexcept>

namespace quantforecast::core {

void ForecastConfig::validate() const {
	if (!(alpha >= 0.0 && alpha <= 1.0)) {
		throw std::invalid_argument("Alpha must be between 0 and 1.");
	}
	if (!(beta >= 0.0 && beta <= 1.0)) {
		throw std::invalid_argument("Beta must be between 0 and 1.");
	}
	if (min_data_points < 2) {
		throw std::invalid_argument("min_data_points must be at least 2.");
	}
	if (max_forecast_horizon < 1) {
		throw std::invalid_argument("max_forecast_horizon must be at least 1.");
	}
	if (max_season_length == 0) {
		throw std::invalid_argument("max_season_length must be positive.");
	}
	if (!std::isfinite(trend_correlation_threshold) || trend_correlation_threshold < 0.0) {
		throw std::invalid_argument("trend_correlation_threshold must be a non-negative number.");
	}
	if (!std::isfinite(outlier_iqr_multiplier) || outlier_iqr_multiplier < 0.0) {
		throw std::invalid_argument("outlier_iqr_multiplier must be a non-negative number.");
	}
	if (std::isnan(volatility_threshold)) {
		throw std::invalid_argument("volatility_threshold must be a number.");
	}
	if (period_days < 1) {
		throw std::invalid_argument("period_days must be at least 1.");
	}
}

} // namespace quantforecast::core
