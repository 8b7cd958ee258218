#include "quant-forecast/selectors/method_selector.hpp"
#include "quant-forecast/utils/logging.hpp"

namespace quantforecast::selectors {

MethodSelector::MethodSelector(const core::ForecastConfig &config)
    : min_length_for_smoothing_(config.min_length_for_smoothing), volatility_threshold_(config.volatility_threshold) {
}

core::MethodVariant MethodSelector::select(const analysis::DataCharacteristics &chars) const {
	core::MethodVariant method;
	if (chars.length < min_length_for_smoothing_) {
		method = core::MethodVariant::LinearRegression;
	} else if (chars.has_trend && chars.volatility < volatility_threshold_) {
		method = core::MethodVariant::DoubleExponentialSmoothing;
	} else if (chars.has_seasonality) {
		method = core::MethodVariant::SeasonalDecomposition;
	} else {
		method = core::MethodVariant::SimpleExponentialSmoothing;
	}

	QUANT_DEBUG("Selected {} for a series of length {}.", core::methodKey(method), chars.length);
	return method;
}

} // namespace quantforecast::selectors
