#include "quant-forecast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace quantforecast::utils {

namespace Statistics {

double mean(const std::vector<double>& data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute mean of empty vector");
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

namespace {

double sumSquaredDeviations(const std::vector<double>& data) {
	const double m = mean(data);
	double accum = 0.0;
	for (double v : data) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return accum;
}

} // namespace

double populationStdDev(const std::vector<double>& data) {
	return std::sqrt(sumSquaredDeviations(data) / static_cast<double>(data.size()));
}

double sampleStdDev(const std::vector<double>& data) {
	if (data.size() < 2) {
		return 0.0;
	}
	return std::sqrt(sumSquaredDeviations(data) / static_cast<double>(data.size() - 1));
}

std::optional<double> pearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have same size");
	}
	if (x.size() < 2) {
		return std::nullopt;
	}

	const double mean_x = mean(x);
	const double mean_y = mean(y);

	double sxy = 0.0;
	double sxx = 0.0;
	double syy = 0.0;
	for (size_t i = 0; i < x.size(); ++i) {
		const double dx = x[i] - mean_x;
		const double dy = y[i] - mean_y;
		sxy += dx * dy;
		sxx += dx * dx;
		syy += dy * dy;
	}

	if (sxx == 0.0 || syy == 0.0) {
		return std::nullopt;
	}

	// Rounding can push |r| marginally past 1 for perfectly linear data.
	return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

double quantile(std::vector<double> data, double q) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute quantile of empty vector");
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile q must be in the range [0, 1].");
	}

	std::sort(data.begin(), data.end());

	const double position = q * static_cast<double>(data.size() - 1);
	const auto lower = static_cast<size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, data.size() - 1);
	const double fraction = position - static_cast<double>(lower);

	return data[lower] + fraction * (data[upper] - data[lower]);
}

} // namespace Statistics
} // namespace quantforecast::utils
