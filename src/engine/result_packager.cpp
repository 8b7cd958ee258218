#include "quant-forecast/engine/result_packager.hpp"
#include "quant-forecast/core/errors.hpp"
#include "quant-forecast/utils/dates.hpp"

#include <cmath>
#include <stdexcept>

namespace quantforecast::engine {

namespace {

void requireFinite(const std::vector<double> &values, const char *what) {
	for (double value : values) {
		if (!std::isfinite(value)) {
			throw core::ForecastError(std::string("Non-finite value in ") + what + ".");
		}
	}
}

} // namespace

ResultPackager::ResultPackager(int period_days) : period_days_(period_days) {
	if (period_days_ <= 0) {
		throw std::invalid_argument("Forecast period must be at least one day.");
	}
}

std::vector<std::string> ResultPackager::forecastDates(const core::TimeSeries::TimePoint &last, int horizon,
                                                       int period_days) {
	std::vector<std::string> dates;
	dates.reserve(horizon > 0 ? static_cast<std::size_t>(horizon) : 0);
	try {
		for (int h = 1; h <= horizon; ++h) {
			dates.push_back(utils::formatDate(utils::addDays(last, static_cast<long long>(period_days) * h)));
		}
	} catch (const std::out_of_range &e) {
		throw core::ForecastError(std::string("Forecast dates cannot be represented: ") + e.what());
	}
	return dates;
}

ForecastResult ResultPackager::package(const models::IForecaster &model, const core::Forecast &forecast,
                                       const core::TimeSeries &history) const {
	if (history.isEmpty()) {
		throw core::ForecastError("Cannot package a forecast without history.");
	}
	if (!forecast.hasIntervals()) {
		throw core::ForecastError("Forecast is missing its confidence interval.");
	}

	const auto &values = forecast.primary();
	const auto &lower = forecast.lowerSeries();
	const auto &upper = forecast.upperSeries();
	if (lower.size() != values.size() || upper.size() != values.size()) {
		throw core::ForecastError("Forecast and interval lengths differ.");
	}

	requireFinite(values, "forecast values");
	requireFinite(lower, "lower bounds");
	requireFinite(upper, "upper bounds");
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (lower[i] > values[i] || values[i] > upper[i]) {
			throw core::ForecastError("Forecast value lies outside its confidence interval.");
		}
	}

	ForecastResult result;
	result.method = model.method();
	result.forecast_values = values;
	result.confidence_lower = lower;
	result.confidence_upper = upper;
	result.forecast_horizon = static_cast<int>(values.size());
	result.forecast_dates = forecastDates(history.lastTimestamp(), result.forecast_horizon, period_days_);
	result.accuracy_metrics = model.accuracy();
	result.seasonal_detected = model.seasonalDetected();
	result.trend_direction = model.trendDirection();
	result.last_actual_value = history.lastValue();
	return result;
}

} // namespace quantforecast::engine
