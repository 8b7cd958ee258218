#pragma once

#include "quant-forecast/analysis/characteristics.hpp"
#include "quant-forecast/core/config.hpp"
#include "quant-forecast/core/method.hpp"
#include "quant-forecast/core/time_series.hpp"
#include "quant-forecast/data/table.hpp"
#include "quant-forecast/engine/forecast_result.hpp"

#include <string>

namespace quantforecast::engine {

/**
 * @brief Entry point of the forecasting pipeline.
 *
 * analyze() prepares the table, characterizes the series, selects a method,
 * forecasts min(periods, max_forecast_horizon) steps and packages the result.
 * The engine keeps nothing between calls, so a single instance may be shared
 * across threads.
 *
 * Validation failures surface as core::ValidationError subclasses; anything
 * else that goes wrong is reported as core::ForecastError.
 */
class ForecastEngine {
public:
	/// @throws std::invalid_argument when the configuration is inconsistent
	explicit ForecastEngine(core::ForecastConfig config = {});

	ForecastResult analyze(const data::Table &table, const std::string &target_column,
	                       const std::string &date_column, int periods, double confidence_level = 0.95) const;

	/// Runs a chosen method on an already prepared series.
	ForecastResult forecastWith(const core::TimeSeries &series, core::MethodVariant method, int periods,
	                            double confidence_level = 0.95) const;

	analysis::DataCharacteristics characterize(const core::TimeSeries &series) const;

	core::MethodVariant selectMethod(const analysis::DataCharacteristics &chars) const;

private:
	int clampHorizon(int periods) const;
	ForecastResult run(const core::TimeSeries &series, core::MethodVariant method, int periods,
	                   double confidence_level) const;

	core::ForecastConfig config_;
};

/**
 * @brief Content fingerprint of a forecast request.
 *
 * 64-bit FNV-1a over the column names, horizon, confidence level and every
 * timestamp/value pair, rendered as 16 lower-case hex digits. Identical
 * requests always map to the same key.
 */
std::string cacheKey(const core::TimeSeries &series, const std::string &target_column,
                     const std::string &date_column, int horizon, double confidence_level);

} // namespace quantforecast::engine
