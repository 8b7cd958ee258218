#include "quant-forecast/models/holt.hpp"
#include "quant-forecast/utils/intervals.hpp"
#include <cmath>
#include <stdexcept>

namespace quantforecast::models {

HoltState holtFilter(const std::vector<double> &values, double alpha, double beta) {
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for Holt's method.");
	}

	HoltState state;
	state.level = values[0];
	state.trend = values.size() > 1 ? values[1] - values[0] : 0.0;
	state.smoothed.reserve(values.size());
	state.smoothed.push_back(state.level);

	for (size_t i = 1; i < values.size(); ++i) {
		const double last_level = state.level;
		state.level = alpha * values[i] + (1.0 - alpha) * (last_level + state.trend);
		state.trend = beta * (state.level - last_level) + (1.0 - beta) * state.trend;
		state.smoothed.push_back(state.level);
	}
	return state;
}

// --- Model Implementation ---

HoltLinearTrend::HoltLinearTrend(double alpha, double beta, double confidence_level)
    : alpha_(alpha), beta_(beta), confidence_level_(confidence_level) {
	if (alpha_ < 0.0 || alpha_ > 1.0) {
		throw std::invalid_argument("Alpha must be between 0 and 1.");
	}
	if (beta_ < 0.0 || beta_ > 1.0) {
		throw std::invalid_argument("Beta must be between 0 and 1.");
	}
}

void HoltLinearTrend::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}

	actual_ = values;
	state_ = holtFilter(values, alpha_, beta_);
	is_fitted_ = true;
	QUANT_INFO("Holt model fitted with {} data points. Final level = {}, Final trend = {}.", values.size(),
	           state_.level, state_.trend);
}

core::Forecast HoltLinearTrend::predict(int horizon) {
	requireFitted();
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	QUANT_INFO("Predicting {} steps ahead.", horizon);

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<size_t>(horizon));

	for (int h = 1; h <= horizon; ++h) {
		series.push_back(state_.level + h * state_.trend);
	}

	utils::attachSymmetricInterval(forecast, utils::Metrics::residuals(actual_, state_.smoothed), confidence_level_);
	return forecast;
}

const std::vector<double> &HoltLinearTrend::fittedValues() const {
	requireFitted();
	return state_.smoothed;
}

utils::AccuracyMetrics HoltLinearTrend::accuracy() const {
	requireFitted();
	auto metrics = score(actual_, state_.smoothed);
	metrics.set("alpha", alpha_);
	metrics.set("beta", beta_);
	metrics.set("final_trend", state_.trend);
	metrics.method_confidence =
	    std::abs(state_.trend) > 0.1 ? core::MethodConfidence::High : core::MethodConfidence::Medium;
	return metrics;
}

core::TrendDirection HoltLinearTrend::trendDirection() const {
	requireFitted();
	return core::directionFromSlope(state_.trend);
}

double HoltLinearTrend::finalTrend() const {
	requireFitted();
	return state_.trend;
}

void HoltLinearTrend::requireFitted() const {
	if (!is_fitted_) {
		throw std::logic_error("HoltLinearTrend has not been fitted.");
	}
}

// --- Builder Implementation ---

HoltLinearTrendBuilder &HoltLinearTrendBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

HoltLinearTrendBuilder &HoltLinearTrendBuilder::withBeta(double beta) {
	beta_ = beta;
	return *this;
}

HoltLinearTrendBuilder &HoltLinearTrendBuilder::withConfidenceLevel(double confidence_level) {
	confidence_level_ = confidence_level;
	return *this;
}

std::unique_ptr<HoltLinearTrend> HoltLinearTrendBuilder::build() {
	QUANT_DEBUG("Building Holt model with alpha = {} and beta = {}.", alpha_, beta_);
	return std::unique_ptr<HoltLinearTrend>(new HoltLinearTrend(alpha_, beta_, confidence_level_));
}

} // namespace quantforecast::models
