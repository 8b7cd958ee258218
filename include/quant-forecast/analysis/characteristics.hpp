#pragma once

#include "quant-forecast/core/config.hpp"
#include "quant-forecast/core/time_series.hpp"

#include <cstddef>
#include <vector>

namespace quantforecast::analysis {

struct DataCharacteristics {
	std::size_t length = 0;
	bool has_trend = false;
	bool has_seasonality = false;
	double volatility = 0.0;
	std::size_t missing_values = 0;
	std::size_t outliers = 0;
};

/**
 * @class CharacteristicsAnalyzer
 * @brief Summarizes a prepared series for method selection.
 *
 * - trend: |Pearson(index, value)| above the configured threshold
 * - seasonality: length alone (at least seasonality_min_length points)
 * - volatility: sample standard deviation
 * - outliers: points outside the Tukey fences of the interpolated quartiles
 */
class CharacteristicsAnalyzer {
public:
	explicit CharacteristicsAnalyzer(const core::ForecastConfig &config = {});

	DataCharacteristics characterize(const core::TimeSeries &series) const;

	bool detectTrend(const std::vector<double> &values) const;
	bool detectSeasonality(const std::vector<double> &values) const;
	std::size_t countOutliers(const std::vector<double> &values) const;

private:
	double trend_correlation_threshold_;
	std::size_t seasonality_min_length_;
	double outlier_iqr_multiplier_;
};

} // namespace quantforecast::analysis
