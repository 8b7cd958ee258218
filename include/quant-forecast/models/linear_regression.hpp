#pragma once

#include "quant-forecast/models/iforecaster.hpp"
#include "quant-forecast/utils/logging.hpp"
#include "quant-forecast/utils/regression.hpp"
#include <stdexcept>

namespace quantforecast::models {

class LinearRegressionBuilder; // Forward declaration

/**
 * @class LinearRegression
 * @brief Extrapolates an ordinary least squares line fitted against the time index.
 *
 * Reports r_squared, mae and rmse; the method confidence is high above an
 * r_squared of 0.7, medium above 0.4 and low otherwise.
 */
class LinearRegression final : public IForecaster {
public:
	friend class LinearRegressionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	const std::vector<double> &fittedValues() const override;
	utils::AccuracyMetrics accuracy() const override;
	core::TrendDirection trendDirection() const override;

	core::MethodVariant method() const override {
		return core::MethodVariant::LinearRegression;
	}

	std::string getName() const override {
		return "LinearRegression";
	}

	double slope() const;
	double intercept() const;

private:
	explicit LinearRegression(double confidence_level);

	void requireFitted() const;

	double confidence_level_;
	std::vector<double> actual_;
	std::vector<double> fitted_;
	utils::LineFit line_;
	bool is_fitted_ = false;
};

/**
 * @class LinearRegressionBuilder
 * @brief A builder for fluently configuring and creating LinearRegression models.
 */
class LinearRegressionBuilder {
public:
	LinearRegressionBuilder &withConfidenceLevel(double confidence_level);

	std::unique_ptr<LinearRegression> build();

private:
	double confidence_level_ = 0.95;
};

} // namespace quantforecast::models
