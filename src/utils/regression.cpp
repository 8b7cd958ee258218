#include "quant-forecast/utils/regression.hpp"

#include <Eigen/Dense>
#include <stdexcept>

namespace quantforecast::utils {

std::vector<double> LineFit::fitted(std::size_t count) const {
	return extrapolate(0, count);
}

std::vector<double> LineFit::extrapolate(std::size_t start, std::size_t count) const {
	std::vector<double> result;
	result.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		result.push_back(at(static_cast<double>(start + i)));
	}
	return result;
}

LineFit fitLine(const std::vector<double> &values) {
	const auto n = static_cast<Eigen::Index>(values.size());
	if (n < 2) {
		throw std::invalid_argument("Need at least 2 points for regression");
	}

	Eigen::MatrixXd design(n, 2);
	for (Eigen::Index i = 0; i < n; ++i) {
		design(i, 0) = static_cast<double>(i);
		design(i, 1) = 1.0;
	}
	const Eigen::VectorXd y = Eigen::VectorXd::Map(values.data(), n);

	const Eigen::VectorXd coeffs = design.colPivHouseholderQr().solve(y);

	LineFit fit;
	fit.slope = coeffs[0];
	fit.intercept = coeffs[1];
	return fit;
}

} // namespace quantforecast::utils
