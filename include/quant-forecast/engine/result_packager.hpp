#pragma once

#include "quant-forecast/core/forecast.hpp"
#include "quant-forecast/core/time_series.hpp"
#include "quant-forecast/engine/forecast_result.hpp"
#include "quant-forecast/models/iforecaster.hpp"

#include <string>
#include <vector>

namespace quantforecast::engine {

/**
 * @brief Assembles a fitted model's output into a ForecastResult.
 *
 * Throws core::ForecastError when the forecast is missing its intervals,
 * when the series lengths disagree, when any value or bound is not finite,
 * or when a point forecast falls outside its interval.
 */
class ResultPackager {
public:
	explicit ResultPackager(int period_days = 30);

	ForecastResult package(const models::IForecaster &model, const core::Forecast &forecast,
	                       const core::TimeSeries &history) const;

	/// Dates of steps 1..horizon after @p last, @p period_days apart.
	/// @throws core::ForecastError when a date falls outside the TimePoint range.
	static std::vector<std::string> forecastDates(const core::TimeSeries::TimePoint &last, int horizon,
	                                              int period_days);

private:
	int period_days_;
};

} // namespace quantforecast::engine
