#pragma once

#include "quant-forecast/core/method.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quantforecast::utils {

/**
 * @struct AccuracyMetrics
 * @brief In-sample accuracy report of a fitted model.
 *
 * Numeric metrics keep the order in which the model reported them so that
 * displays list them consistently; the key set depends on the method.
 */
struct AccuracyMetrics {
	using Entry = std::pair<std::string, double>;

	std::vector<Entry> values;
	core::MethodConfidence method_confidence = core::MethodConfidence::Medium;

	/// Adds a metric, replacing the value of an existing key in place.
	void set(const std::string &name, double value);

	std::optional<double> get(const std::string &name) const;

	bool contains(const std::string &name) const {
		return get(name).has_value();
	}

	std::size_t size() const {
		return values.size();
	}
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Coefficient of determination; 0 when the actuals have no variance.
	static double r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// actual[i] - predicted[i] for every position.
	static std::vector<double> residuals(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace quantforecast::utils
