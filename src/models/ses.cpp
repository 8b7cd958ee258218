#include "quant-forecast/models/ses.hpp"
#include "quant-forecast/utils/intervals.hpp"
#include <stdexcept>

namespace quantforecast::models {

std::vector<double> smoothLevels(const std::vector<double> &values, double alpha) {
	std::vector<double> smoothed;
	if (values.empty()) {
		return smoothed;
	}
	smoothed.reserve(values.size());
	smoothed.push_back(values.front());
	for (size_t i = 1; i < values.size(); ++i) {
		smoothed.push_back(alpha * values[i] + (1.0 - alpha) * smoothed.back());
	}
	return smoothed;
}

// --- Model Implementation ---

SimpleExponentialSmoothing::SimpleExponentialSmoothing(double alpha, double confidence_level)
    : alpha_(alpha), confidence_level_(confidence_level) {
	if (alpha_ < 0.0 || alpha_ > 1.0) {
		throw std::invalid_argument("Alpha must be between 0 and 1.");
	}
}

void SimpleExponentialSmoothing::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}

	actual_ = values;
	smoothed_ = smoothLevels(values, alpha_);

	is_fitted_ = true;
	QUANT_INFO("SES model fitted with {} data points. Final level = {}.", values.size(), smoothed_.back());
}

core::Forecast SimpleExponentialSmoothing::predict(int horizon) {
	requireFitted();
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	QUANT_INFO("Predicting {} steps ahead.", horizon);

	// For SES, the forecast for all future points is simply the last calculated level.
	core::Forecast forecast;
	forecast.primary().assign(static_cast<size_t>(horizon), smoothed_.back());
	utils::attachSymmetricInterval(forecast, utils::Metrics::residuals(actual_, smoothed_), confidence_level_);
	return forecast;
}

const std::vector<double> &SimpleExponentialSmoothing::fittedValues() const {
	requireFitted();
	return smoothed_;
}

utils::AccuracyMetrics SimpleExponentialSmoothing::accuracy() const {
	requireFitted();
	auto metrics = score(actual_, smoothed_);
	metrics.set("alpha", alpha_);
	metrics.method_confidence = core::MethodConfidence::Medium;
	return metrics;
}

void SimpleExponentialSmoothing::requireFitted() const {
	if (!is_fitted_) {
		throw std::logic_error("SimpleExponentialSmoothing has not been fitted.");
	}
}

// --- Builder Implementation ---

SimpleExponentialSmoothingBuilder &SimpleExponentialSmoothingBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

SimpleExponentialSmoothingBuilder &SimpleExponentialSmoothingBuilder::withConfidenceLevel(double confidence_level) {
	confidence_level_ = confidence_level;
	return *this;
}

std::unique_ptr<SimpleExponentialSmoothing> SimpleExponentialSmoothingBuilder::build() {
	QUANT_DEBUG("Building SES model with alpha = {}.", alpha_);
	return std::unique_ptr<SimpleExponentialSmoothing>(new SimpleExponentialSmoothing(alpha_, confidence_level_));
}

} // namespace quantforecast::models
