#pragma once

#include "quant-forecast/core/config.hpp"
#include "quant-forecast/core/method.hpp"
#include "quant-forecast/models/iforecaster.hpp"
#include <memory>

namespace quantforecast::models {

/**
 * @brief Creates an unfitted forecaster for a method variant.
 *
 * Smoothing weights and the seasonal cycle cap come from the configuration;
 * every model widens its intervals according to @p confidence_level.
 */
class ModelFactory {
public:
	static std::unique_ptr<IForecaster> create(core::MethodVariant method, const core::ForecastConfig &config,
	                                           double confidence_level);
};

} // namespace quantforecast::models
