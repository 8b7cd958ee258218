#pragma once

#include "quant-forecast/models/iforecaster.hpp"
#include "quant-forecast/utils/logging.hpp"
#include "quant-forecast/utils/regression.hpp"
#include <cstddef>
#include <stdexcept>

namespace quantforecast::models {

/**
 * @brief Average deviation from the overall mean for each position in the cycle.
 *
 * pattern[j] = mean(values[i] for i % season_length == j) - mean(values).
 *
 * @throws std::invalid_argument when season_length is 0 or exceeds the series length
 */
std::vector<double> seasonalPattern(const std::vector<double> &values, std::size_t season_length);

/// values[i] - pattern[i % pattern.size()].
std::vector<double> deseasonalize(const std::vector<double> &values, const std::vector<double> &pattern);

class SeasonalDecompositionBuilder; // Forward declaration

/**
 * @class SeasonalDecomposition
 * @brief Additive decomposition into a repeating seasonal pattern plus a linear trend.
 *
 * The cycle length is min(max_season_length, n / 2). The trend is fitted on
 * the deseasonalized series and the pattern is added back to every forecast
 * step according to its position in the cycle.
 */
class SeasonalDecomposition final : public IForecaster {
public:
	friend class SeasonalDecompositionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	const std::vector<double> &fittedValues() const override;
	utils::AccuracyMetrics accuracy() const override;

	core::TrendDirection trendDirection() const override {
		return core::TrendDirection::Seasonal;
	}

	bool seasonalDetected() const override {
		return true;
	}

	core::MethodVariant method() const override {
		return core::MethodVariant::SeasonalDecomposition;
	}

	std::string getName() const override {
		return "SeasonalDecomposition";
	}

	std::size_t seasonLength() const;
	const std::vector<double> &pattern() const;
	const utils::LineFit &trendLine() const;

private:
	SeasonalDecomposition(std::size_t max_season_length, double confidence_level);

	void requireFitted() const;

	std::size_t max_season_length_;
	double confidence_level_;
	std::size_t season_length_ = 0;
	std::vector<double> actual_;
	std::vector<double> pattern_;
	std::vector<double> reconstructed_;
	utils::LineFit trend_;
	bool is_fitted_ = false;
};

/**
 * @class SeasonalDecompositionBuilder
 * @brief A builder for fluently configuring and creating SeasonalDecomposition models.
 */
class SeasonalDecompositionBuilder {
public:
	/**
	 * @brief Caps the seasonal cycle length.
	 * @param max_season_length Longest cycle considered (at least 1).
	 * @return A reference to the builder for chaining.
	 */
	SeasonalDecompositionBuilder &withMaxSeasonLength(std::size_t max_season_length);

	SeasonalDecompositionBuilder &withConfidenceLevel(double confidence_level);

	std::unique_ptr<SeasonalDecomposition> build();

private:
	std::size_t max_season_length_ = 12;
	double confidence_level_ = 0.95;
};

} // namespace quantforecast::models
