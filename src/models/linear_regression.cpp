#include "quant-forecast/models/linear_regression.hpp"
#include "quant-forecast/utils/intervals.hpp"
#include <stdexcept>

namespace quantforecast::models {

// --- Model Implementation ---

LinearRegression::LinearRegression(double confidence_level) : confidence_level_(confidence_level) {
}

void LinearRegression::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		throw std::invalid_argument("Time series must have at least 2 data points for linear regression.");
	}

	actual_ = values;
	line_ = utils::fitLine(values);
	fitted_ = line_.fitted(values.size());
	is_fitted_ = true;
	QUANT_INFO("Linear regression fitted with {} data points. Slope = {}, intercept = {}.", values.size(),
	           line_.slope, line_.intercept);
}

core::Forecast LinearRegression::predict(int horizon) {
	requireFitted();
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	QUANT_INFO("Predicting {} steps ahead.", horizon);

	// Step h lands on index n - 1 + h.
	core::Forecast forecast;
	forecast.primary() = line_.extrapolate(actual_.size(), static_cast<size_t>(horizon));
	utils::attachSymmetricInterval(forecast, utils::Metrics::residuals(actual_, fitted_), confidence_level_);
	return forecast;
}

const std::vector<double> &LinearRegression::fittedValues() const {
	requireFitted();
	return fitted_;
}

utils::AccuracyMetrics LinearRegression::accuracy() const {
	requireFitted();
	const double r_squared = utils::Metrics::r2(actual_, fitted_);

	utils::AccuracyMetrics metrics;
	metrics.set("r_squared", r_squared);
	for (const auto &entry : score(actual_, fitted_).values) {
		metrics.set(entry.first, entry.second);
	}
	if (r_squared > 0.7) {
		metrics.method_confidence = core::MethodConfidence::High;
	} else if (r_squared > 0.4) {
		metrics.method_confidence = core::MethodConfidence::Medium;
	} else {
		metrics.method_confidence = core::MethodConfidence::Low;
	}
	return metrics;
}

core::TrendDirection LinearRegression::trendDirection() const {
	requireFitted();
	return core::directionFromSlope(line_.slope);
}

double LinearRegression::slope() const {
	requireFitted();
	return line_.slope;
}

double LinearRegression::intercept() const {
	requireFitted();
	return line_.intercept;
}

void LinearRegression::requireFitted() const {
	if (!is_fitted_) {
		throw std::logic_error("LinearRegression has not been fitted.");
	}
}

// --- Builder Implementation ---

LinearRegressionBuilder &LinearRegressionBuilder::withConfidenceLevel(double confidence_level) {
	confidence_level_ = confidence_level;
	return *this;
}

std::unique_ptr<LinearRegression> LinearRegressionBuilder::build() {
	QUANT_DEBUG("Building linear regression model.");
	return std::unique_ptr<LinearRegression>(new LinearRegression(confidence_level_));
}

} // namespace quantforecast::models
