#pragma once

#include "quant-forecast/analysis/characteristics.hpp"
#include "quant-forecast/core/config.hpp"
#include "quant-forecast/core/method.hpp"

#include <cstddef>

namespace quantforecast::selectors {

/**
 * @class MethodSelector
 * @brief Rule-based choice of a forecasting method from series characteristics.
 *
 * Rules are evaluated in order, the first match wins:
 *  1. length < min_length_for_smoothing      -> LinearRegression
 *  2. trend and volatility < threshold       -> DoubleExponentialSmoothing
 *  3. seasonality                            -> SeasonalDecomposition
 *  4. otherwise                              -> SimpleExponentialSmoothing
 *
 * The volatility threshold is an absolute value, independent of series scale.
 */
class MethodSelector {
public:
	explicit MethodSelector(const core::ForecastConfig &config = {});

	core::MethodVariant select(const analysis::DataCharacteristics &chars) const;

private:
	std::size_t min_length_for_smoothing_;
	double volatility_threshold_;
};

} // namespace quantforecast::selectors
