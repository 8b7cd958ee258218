#pragma once

#include "quant-forecast/core/forecast.hpp"

#include <vector>

namespace quantforecast::utils {

/**
 * @brief z-score used to size confidence bounds.
 *
 * Two-point table: 1.96 for exactly 0.95, 2.576 for every other level.
 */
double zScore(double confidence_level);

/**
 * @brief Attaches bounds of point ± z * sd(residuals) to a forecast.
 *
 * The residual spread uses the population standard deviation. An empty
 * residual set yields zero-width bounds.
 */
void attachSymmetricInterval(core::Forecast &forecast, const std::vector<double> &residuals,
                             double confidence_level);

} // namespace quantforecast::utils
