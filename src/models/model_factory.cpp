#include "quant-forecast/models/model_factory.hpp"
#include "quant-forecast/models/holt.hpp"
#include "quant-forecast/models/linear_regression.hpp"
#include "quant-forecast/models/seasonal_decomposition.hpp"
#include "quant-forecast/models/ses.hpp"
#include "quant-forecast/utils/logging.hpp"
#include <stdexcept>

namespace quantforecast::models {

std::unique_ptr<IForecaster> ModelFactory::create(core::MethodVariant method, const core::ForecastConfig &config,
                                                  double confidence_level) {
	QUANT_DEBUG("Creating model '{}'.", core::methodKey(method));

	switch (method) {
	case core::MethodVariant::LinearRegression:
		return LinearRegressionBuilder().withConfidenceLevel(confidence_level).build();
	case core::MethodVariant::SimpleExponentialSmoothing:
		return SimpleExponentialSmoothingBuilder()
		    .withAlpha(config.alpha)
		    .withConfidenceLevel(confidence_level)
		    .build();
	case core::MethodVariant::DoubleExponentialSmoothing:
		return HoltLinearTrendBuilder()
		    .withAlpha(config.alpha)
		    .withBeta(config.beta)
		    .withConfidenceLevel(confidence_level)
		    .build();
	case core::MethodVariant::SeasonalDecomposition:
		return SeasonalDecompositionBuilder()
		    .withMaxSeasonLength(config.max_season_length)
		    .withConfidenceLevel(confidence_level)
		    .build();
	}
	throw std::invalid_argument("Unknown forecasting method.");
}

} // namespace quantforecast::models
