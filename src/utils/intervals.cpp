#include "quant-forecast/utils/intervals.hpp"
#include "quant-forecast/utils/statistics.hpp"

namespace quantforecast::utils {

double zScore(double confidence_level) {
	return confidence_level == 0.95 ? 1.96 : 2.576;
}

void attachSymmetricInterval(core::Forecast &forecast, const std::vector<double> &residuals,
                             double confidence_level) {
	const double spread = residuals.empty() ? 0.0 : Statistics::populationStdDev(residuals);
	const double margin = zScore(confidence_level) * spread;

	auto &lower = forecast.lowerSeries();
	auto &upper = forecast.upperSeries();
	lower.clear();
	upper.clear();
	lower.reserve(forecast.horizon());
	upper.reserve(forecast.horizon());
	for (double value : forecast.primary()) {
		lower.push_back(value - margin);
		upper.push_back(value + margin);
	}
}

} // namespace quantforecast::utils
