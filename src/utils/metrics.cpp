#include "quant-forecast/utils/metrics.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace quantforecast::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

} // namespace

void AccuracyMetrics::set(const std::string &name, double value) {
	for (auto &entry : values) {
		if (entry.first == name) {
			entry.second = value;
			return;
		}
	}
	values.emplace_back(name, value);
}

std::optional<double> AccuracyMetrics::get(const std::string &name) const {
	for (const auto &entry : values) {
		if (entry.first == name) {
			return entry.second;
		}
	}
	return std::nullopt;
}

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

double Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	const double mean_actual = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());

	double ss_res = 0.0;
	double ss_tot = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff_res = actual[i] - predicted[i];
		ss_res += diff_res * diff_res;

		const double diff_tot = actual[i] - mean_actual;
		ss_tot += diff_tot * diff_tot;
	}

	if (ss_tot == 0.0) {
		return 0.0;
	}

	return 1.0 - (ss_res / ss_tot);
}

std::vector<double> Metrics::residuals(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	std::vector<double> result(actual.size());
	for (size_t i = 0; i < actual.size(); ++i) {
		result[i] = actual[i] - predicted[i];
	}
	return result;
}

} // namespace quantforecast::utils
