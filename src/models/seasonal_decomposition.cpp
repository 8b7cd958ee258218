#include "quant-forecast/models/seasonal_decomposition.hpp"
#include "quant-forecast/utils/intervals.hpp"
#include "quant-forecast/utils/statistics.hpp"
#include <algorithm>
#include <stdexcept>

namespace quantforecast::models {

std::vector<double> seasonalPattern(const std::vector<double> &values, std::size_t season_length) {
	if (season_length == 0) {
		throw std::invalid_argument("Season length must be positive.");
	}
	if (season_length > values.size()) {
		throw std::invalid_argument("Season length cannot exceed the series length.");
	}

	std::vector<double> sums(season_length, 0.0);
	std::vector<std::size_t> counts(season_length, 0);
	for (std::size_t i = 0; i < values.size(); ++i) {
		sums[i % season_length] += values[i];
		++counts[i % season_length];
	}

	const double overall = utils::Statistics::mean(values);
	std::vector<double> pattern(season_length);
	for (std::size_t j = 0; j < season_length; ++j) {
		pattern[j] = sums[j] / static_cast<double>(counts[j]) - overall;
	}
	return pattern;
}

std::vector<double> deseasonalize(const std::vector<double> &values, const std::vector<double> &pattern) {
	if (pattern.empty()) {
		throw std::invalid_argument("Seasonal pattern cannot be empty.");
	}
	std::vector<double> result(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		result[i] = values[i] - pattern[i % pattern.size()];
	}
	return result;
}

// --- Model Implementation ---

SeasonalDecomposition::SeasonalDecomposition(std::size_t max_season_length, double confidence_level)
    : max_season_length_(max_season_length), confidence_level_(confidence_level) {
	if (max_season_length_ == 0) {
		throw std::invalid_argument("Maximum season length must be at least 1.");
	}
}

void SeasonalDecomposition::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		throw std::invalid_argument("Time series must have at least 2 data points for seasonal decomposition.");
	}

	actual_ = values;
	season_length_ = std::min(max_season_length_, values.size() / 2);
	pattern_ = seasonalPattern(values, season_length_);

	const auto deseasonalized = deseasonalize(values, pattern_);
	trend_ = utils::fitLine(deseasonalized);

	reconstructed_.resize(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		reconstructed_[i] = deseasonalized[i] + pattern_[i % season_length_];
	}

	is_fitted_ = true;
	QUANT_INFO("Seasonal decomposition fitted with {} data points. Season length = {}, trend slope = {}.",
	           values.size(), season_length_, trend_.slope);
}

core::Forecast SeasonalDecomposition::predict(int horizon) {
	requireFitted();
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	QUANT_INFO("Predicting {} steps ahead.", horizon);

	const std::size_t n = actual_.size();
	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));
	for (int h = 1; h <= horizon; ++h) {
		const std::size_t position = n - 1 + static_cast<std::size_t>(h);
		series.push_back(trend_.at(static_cast<double>(position)) + pattern_[position % season_length_]);
	}

	utils::attachSymmetricInterval(forecast, utils::Metrics::residuals(actual_, reconstructed_), confidence_level_);
	return forecast;
}

const std::vector<double> &SeasonalDecomposition::fittedValues() const {
	requireFitted();
	return reconstructed_;
}

utils::AccuracyMetrics SeasonalDecomposition::accuracy() const {
	requireFitted();
	auto metrics = score(actual_, reconstructed_);
	metrics.set("seasonal_strength", utils::Statistics::populationStdDev(pattern_));
	metrics.method_confidence = core::MethodConfidence::High;
	return metrics;
}

std::size_t SeasonalDecomposition::seasonLength() const {
	requireFitted();
	return season_length_;
}

const std::vector<double> &SeasonalDecomposition::pattern() const {
	requireFitted();
	return pattern_;
}

const utils::LineFit &SeasonalDecomposition::trendLine() const {
	requireFitted();
	return trend_;
}

void SeasonalDecomposition::requireFitted() const {
	if (!is_fitted_) {
		throw std::logic_error("SeasonalDecomposition has not been fitted.");
	}
}

// --- Builder Implementation ---

SeasonalDecompositionBuilder &SeasonalDecompositionBuilder::withMaxSeasonLength(std::size_t max_season_length) {
	max_season_length_ = max_season_length;
	return *this;
}

SeasonalDecompositionBuilder &SeasonalDecompositionBuilder::withConfidenceLevel(double confidence_level) {
	confidence_level_ = confidence_level;
	return *this;
}

std::unique_ptr<SeasonalDecomposition> SeasonalDecompositionBuilder::build() {
	QUANT_DEBUG("Building seasonal decomposition model with max season length = {}.", max_season_length_);
	return std::unique_ptr<SeasonalDecomposition>(new SeasonalDecomposition(max_season_length_, confidence_level_));
}

} // namespace quantforecast::models
