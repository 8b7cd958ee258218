#pragma once

#include <optional>
#include <vector>

namespace quantforecast::utils {

/**
 * @brief Descriptive statistics shared by the analyzer and the models
 */
namespace Statistics {

/**
 * @brief Arithmetic mean
 * @throws std::invalid_argument on empty input
 */
double mean(const std::vector<double>& data);

/**
 * @brief Standard deviation with an n denominator
 *
 * Used for residual spread and seasonal strength. Returns 0 for a single value.
 */
double populationStdDev(const std::vector<double>& data);

/**
 * @brief Standard deviation with an n - 1 denominator
 *
 * Returns 0 when fewer than two values are present.
 */
double sampleStdDev(const std::vector<double>& data);

/**
 * @brief Pearson correlation between x and y
 *
 * @return std::nullopt when either input has zero variance or fewer than two points
 */
std::optional<double> pearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Quantile with linear interpolation between order statistics
 *
 * The position of quantile q is q * (n - 1) in the sorted data, matching the
 * default of most dataframe libraries.
 *
 * @param data Input data (copied and sorted internally)
 * @param q Quantile in [0, 1]
 */
double quantile(std::vector<double> data, double q);

} // namespace Statistics
} // namespace quantforecast::utils
