#pragma once

#include <cstddef>
#include <vector>

namespace quantforecast::utils {

/**
 * @struct LineFit
 * @brief Ordinary least squares line y = slope * x + intercept over x = 0..n-1.
 */
struct LineFit {
	double slope = 0.0;
	double intercept = 0.0;

	double at(double x) const {
		return slope * x + intercept;
	}

	/// Fitted values for x = 0..count-1.
	std::vector<double> fitted(std::size_t count) const;

	/// Values for x = start..start+count-1.
	std::vector<double> extrapolate(std::size_t start, std::size_t count) const;
};

/**
 * @brief Fits a straight line against the position index of each value.
 *
 * Solves the two-column least squares problem with a column-pivoting
 * Householder QR decomposition.
 *
 * @throws std::invalid_argument when fewer than two values are given
 */
LineFit fitLine(const std::vector<double> &values);

} // namespace quantforecast::utils
