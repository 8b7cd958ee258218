#pragma once

#include "quant-forecast/models/iforecaster.hpp"
#include "quant-forecast/utils/logging.hpp"
#include <stdexcept>

namespace quantforecast::models {

/**
 * @struct HoltState
 * @brief Result of running Holt's recursions over a series.
 */
struct HoltState {
	double level = 0.0;
	double trend = 0.0;
	/// Level after each observation; smoothed[0] is the first observation.
	std::vector<double> smoothed;
};

/**
 * @brief Runs Holt's level/trend recursions over @p values.
 *
 * Initial level is values[0] and initial trend values[1] - values[0] (0 for a
 * single observation).
 *
 * @throws std::invalid_argument on an empty series
 */
HoltState holtFilter(const std::vector<double> &values, double alpha, double beta);

class HoltLinearTrendBuilder; // Forward declaration

/**
 * @class HoltLinearTrend
 * @brief A forecasting model that extends Simple Exponential Smoothing to capture a trend.
 *
 * This model includes a second smoothing parameter, beta, for the trend component.
 */
class HoltLinearTrend final : public IForecaster {
public:
	friend class HoltLinearTrendBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	const std::vector<double> &fittedValues() const override;
	utils::AccuracyMetrics accuracy() const override;
	core::TrendDirection trendDirection() const override;

	core::MethodVariant method() const override {
		return core::MethodVariant::DoubleExponentialSmoothing;
	}

	std::string getName() const override {
		return "HoltLinearTrend";
	}

	double finalTrend() const;

private:
	/**
	 * @brief Private constructor for HoltLinearTrend model.
	 * @param alpha The smoothing parameter for the level, between 0 and 1.
	 * @param beta The smoothing parameter for the trend, between 0 and 1.
	 * @param confidence_level Confidence level used to size the bounds.
	 */
	HoltLinearTrend(double alpha, double beta, double confidence_level);

	void requireFitted() const;

	double alpha_;
	double beta_;
	double confidence_level_;
	std::vector<double> actual_;
	HoltState state_;
	bool is_fitted_ = false;
};

/**
 * @class HoltLinearTrendBuilder
 * @brief A builder for fluently configuring and creating HoltLinearTrend models.
 */
class HoltLinearTrendBuilder {
public:
	/**
	 * @brief Sets the alpha smoothing parameter for the level.
	 * @param alpha The smoothing parameter (0 to 1).
	 * @return A reference to the builder for chaining.
	 */
	HoltLinearTrendBuilder &withAlpha(double alpha);

	/**
	 * @brief Sets the beta smoothing parameter for the trend.
	 * @param beta The smoothing parameter (0 to 1).
	 * @return A reference to the builder for chaining.
	 */
	HoltLinearTrendBuilder &withBeta(double beta);

	HoltLinearTrendBuilder &withConfidenceLevel(double confidence_level);

	/**
	 * @brief Creates a new HoltLinearTrend model instance.
	 * @return A unique pointer to the configured model.
	 */
	std::unique_ptr<HoltLinearTrend> build();

private:
	double alpha_ = 0.3;
	double beta_ = 0.1;
	double confidence_level_ = 0.95;
};

} // namespace quantforecast::models
