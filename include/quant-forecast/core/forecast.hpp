#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace quantforecast::core {

/**
 * @struct Forecast
 * @brief Holds the raw output of a forecasting model.
 *
 * Contains the point predictions and, once a model has attached them, the
 * lower and upper confidence bounds for every step.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per horizon step.
	Series point;

	/// Optional lower bounds of the confidence interval.
	std::optional<Series> lower;

	/// Optional upper bounds of the confidence interval.
	std::optional<Series> upper;

	Series &primary() {
		return point;
	}

	const Series &primary() const {
		return point;
	}

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}

	bool hasIntervals() const {
		return lower.has_value() && upper.has_value();
	}

	/// Access (and create when needed) the lower bound series.
	Series &lowerSeries() {
		if (!lower.has_value()) {
			lower.emplace();
		}
		return *lower;
	}

	/// Access (and create when needed) the upper bound series.
	Series &upperSeries() {
		if (!upper.has_value()) {
			upper.emplace();
		}
		return *upper;
	}

	const Series &lowerSeries() const {
		if (!lower.has_value()) {
			throw std::out_of_range("Lower interval not available.");
		}
		return *lower;
	}

	const Series &upperSeries() const {
		if (!upper.has_value()) {
			throw std::out_of_range("Upper interval not available.");
		}
		return *upper;
	}
};

} // namespace quantforecast::core
