#pragma once

#include "quant-forecast/models/iforecaster.hpp"
#include "quant-forecast/utils/logging.hpp"
#include <stdexcept>

namespace quantforecast::models {

/**
 * @brief Exponentially smoothed levels of a series.
 *
 * smoothed[0] = values[0]; smoothed[i] = alpha * values[i] + (1 - alpha) * smoothed[i - 1].
 */
std::vector<double> smoothLevels(const std::vector<double> &values, double alpha);

class SimpleExponentialSmoothingBuilder; // Forward declaration

/**
 * @class SimpleExponentialSmoothing
 * @brief A forecasting model that uses a weighted average of past observations,
 *        with the weights decaying exponentially over time.
 *
 * The forecast is flat at the last smoothed level and never reports a
 * directional trend.
 */
class SimpleExponentialSmoothing final : public IForecaster {
public:
	friend class SimpleExponentialSmoothingBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	const std::vector<double> &fittedValues() const override;
	utils::AccuracyMetrics accuracy() const override;

	core::TrendDirection trendDirection() const override {
		return core::TrendDirection::Stable;
	}

	core::MethodVariant method() const override {
		return core::MethodVariant::SimpleExponentialSmoothing;
	}

	std::string getName() const override {
		return "SimpleExponentialSmoothing";
	}

private:
	/**
	 * @brief Private constructor for SimpleExponentialSmoothing model.
	 * @param alpha The smoothing parameter for the level, between 0 and 1.
	 * @param confidence_level Confidence level used to size the bounds.
	 */
	SimpleExponentialSmoothing(double alpha, double confidence_level);

	void requireFitted() const;

	double alpha_;
	double confidence_level_;
	std::vector<double> actual_;
	std::vector<double> smoothed_;
	bool is_fitted_ = false;
};

/**
 * @class SimpleExponentialSmoothingBuilder
 * @brief A builder for fluently configuring and creating SimpleExponentialSmoothing models.
 */
class SimpleExponentialSmoothingBuilder {
public:
	/**
	 * @brief Sets the alpha smoothing parameter.
	 * @param alpha The smoothing parameter for the level (0 to 1).
	 * @return A reference to the builder for chaining.
	 */
	SimpleExponentialSmoothingBuilder &withAlpha(double alpha);

	SimpleExponentialSmoothingBuilder &withConfidenceLevel(double confidence_level);

	/**
	 * @brief Creates a new SimpleExponentialSmoothing model instance.
	 * @return A unique pointer to the configured model.
	 */
	std::unique_ptr<SimpleExponentialSmoothing> build();

private:
	double alpha_ = 0.3;
	double confidence_level_ = 0.95;
};

} // namespace quantforecast::models
