#pragma once

#include <string>

namespace quantforecast::core {

/// The closed set of forecasting methods the pipeline can select.
enum class MethodVariant {
	LinearRegression,
	SimpleExponentialSmoothing,
	DoubleExponentialSmoothing,
	SeasonalDecomposition
};

/// Qualitative direction reported alongside a forecast.
enum class TrendDirection {
	Increasing,
	Decreasing,
	Stable,
	Seasonal
};

/// Qualitative trust a method places in its own fit.
enum class MethodConfidence {
	High,
	Medium,
	Low
};

/// Human readable name, e.g. "Double Exponential Smoothing".
std::string displayName(MethodVariant method);

/// Stable snake_case key, e.g. "double_exponential_smoothing".
std::string methodKey(MethodVariant method);

/// Lower-case label: "increasing", "decreasing", "stable" or "seasonal".
std::string toString(TrendDirection direction);

/// Lower-case label: "high", "medium" or "low".
std::string toString(MethodConfidence confidence);

/// Direction implied by the sign of a slope or trend term.
TrendDirection directionFromSlope(double slope);

} // namespace quantforecast::core
