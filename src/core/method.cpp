#include "quant-forecast/core/method.hpp"

#include <stdexcept>

namespace quantforecast::core {

std::string displayName(MethodVariant method) {
	switch (method) {
	case MethodVariant::LinearRegression:
		return "Linear Regression";
	case MethodVariant::SimpleExponentialSmoothing:
		return "Simple Exponential Smoothing";
	case MethodVariant::DoubleExponentialSmoothing:
		return "Double Exponential Smoothing";
	case MethodVariant::SeasonalDecomposition:
		return "Seasonal Decomposition";
	}
	throw std::invalid_argument("Unknown forecasting method.");
}

std::string methodKey(MethodVariant method) {
	switch (method) {
	case MethodVariant::LinearRegression:
		return "linear_regression";
	case MethodVariant::SimpleExponentialSmoothing:
		return "simple_exponential_smoothing";
	case MethodVariant::DoubleExponentialSmoothing:
		return "double_exponential_smoothing";
	case MethodVariant::SeasonalDecomposition:
		return "seasonal_decomposition";
	}
	throw std::invalid_argument("Unknown forecasting method.");
}

std::string toString(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Stable:
		return "stable";
	case TrendDirection::Seasonal:
		return "seasonal";
	}
	throw std::invalid_argument("Unknown trend direction.");
}

std::string toString(MethodConfidence confidence) {
	switch (confidence) {
	case MethodConfidence::High:
		return "high";
	case MethodConfidence::Medium:
		return "medium";
	case MethodConfidence::Low:
		return "low";
	}
	throw std::invalid_argument("Unknown method confidence.");
}

TrendDirection directionFromSlope(double slope) {
	if (slope > 0.0) {
		return TrendDirection::Increasing;
	}
	if (slope < 0.0) {
		return TrendDirection::Decreasing;
	}
	return TrendDirection::Stable;
}

} // namespace quantforecast::core
