#pragma once

#include "quant-forecast/core/forecast.hpp"
#include "quant-forecast/core/method.hpp"
#include "quant-forecast/core/time_series.hpp"
#include "quant-forecast/utils/metrics.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quantforecast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * A model is fitted once on a prepared series and then asked for a forecast.
 * Besides the point forecast and its confidence bounds, every model reports
 * its in-sample fit, accuracy metrics and the qualitative trend it found.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The prepared series to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @return A Forecast with point predictions and lower/upper confidence bounds.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/// In-sample fitted or smoothed values, aligned with the training series.
	virtual const std::vector<double> &fittedValues() const = 0;

	/// Method-specific accuracy metrics of the in-sample fit.
	virtual utils::AccuracyMetrics accuracy() const = 0;

	virtual core::TrendDirection trendDirection() const = 0;

	virtual bool seasonalDetected() const {
		return false;
	}

	virtual core::MethodVariant method() const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 * @return A string representing the model's name (e.g., "HoltLinearTrend").
	 */
	virtual std::string getName() const = 0;

protected:
	/**
	 * @brief Error metrics shared by all models.
	 * @return Metrics holding "mae" and "rmse" of @p predicted against @p actual.
	 */
	static utils::AccuracyMetrics score(const std::vector<double> &actual, const std::vector<double> &predicted) {
		utils::AccuracyMetrics metrics;
		metrics.set("mae", utils::Metrics::mae(actual, predicted));
		metrics.set("rmse", utils::Metrics::rmse(actual, predicted));
		return metrics;
	}
};

} // namespace quantforecast::models
