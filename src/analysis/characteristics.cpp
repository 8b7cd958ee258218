#include "quant-forecast/analysis/characteristics.hpp"
#include "quant-forecast/utils/logging.hpp"
#include "quant-forecast/utils/statistics.hpp"

#include <cmath>
#include <numeric>

namespace quantforecast::analysis {

using utils::Statistics::pearsonCorrelation;
using utils::Statistics::quantile;
using utils::Statistics::sampleStdDev;

CharacteristicsAnalyzer::CharacteristicsAnalyzer(const core::ForecastConfig &config)
    : trend_correlation_threshold_(config.trend_correlation_threshold),
      seasonality_min_length_(config.seasonality_min_length), outlier_iqr_multiplier_(config.outlier_iqr_multiplier) {
}

bool CharacteristicsAnalyzer::detectTrend(const std::vector<double> &values) const {
	std::vector<double> index(values.size());
	std::iota(index.begin(), index.end(), 0.0);
	const auto correlation = pearsonCorrelation(index, values);
	return correlation.has_value() && std::abs(*correlation) > trend_correlation_threshold_;
}

bool CharacteristicsAnalyzer::detectSeasonality(const std::vector<double> &values) const {
	return values.size() >= seasonality_min_length_;
}

std::size_t CharacteristicsAnalyzer::countOutliers(const std::vector<double> &values) const {
	if (values.empty()) {
		return 0;
	}
	const double q1 = quantile(values, 0.25);
	const double q3 = quantile(values, 0.75);
	const double iqr = q3 - q1;
	const double lower = q1 - outlier_iqr_multiplier_ * iqr;
	const double upper = q3 + outlier_iqr_multiplier_ * iqr;

	std::size_t count = 0;
	for (double v : values) {
		if (v < lower || v > upper) {
			++count;
		}
	}
	return count;
}

DataCharacteristics CharacteristicsAnalyzer::characterize(const core::TimeSeries &series) const {
	DataCharacteristics chars;
	chars.length = series.size();
	chars.missing_values = series.countMissingValues();

	// Statistics are computed over the finite observations only.
	const auto clean = chars.missing_values > 0 ? series.sanitized() : series;
	const auto &values = clean.getValues();

	chars.has_trend = detectTrend(values);
	chars.has_seasonality = detectSeasonality(values);
	chars.volatility = sampleStdDev(values);
	chars.outliers = countOutliers(values);

	QUANT_DEBUG("Series characteristics: length={}, trend={}, seasonal={}, volatility={:.4f}, missing={}, "
	            "outliers={}.",
	            chars.length, chars.has_trend, chars.has_seasonality, chars.volatility, chars.missing_values,
	            chars.outliers);
	return chars;
}

} // namespace quantforecast::analysis
