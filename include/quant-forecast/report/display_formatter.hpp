#pragma once

#include "quant-forecast/engine/forecast_result.hpp"

#include <string>

namespace quantforecast::report {

/**
 * @brief Renders a ForecastResult as a short markdown-flavoured report.
 *
 * The report has a title, a summary block (method, periods, trend,
 * seasonality, last value), one line per forecast step with its interval,
 * the accuracy metrics and a few key insights. Monetary values are shown as
 * $1,234.56 and metrics with three decimals.
 */
class DisplayFormatter {
public:
	std::string format(const engine::ForecastResult &result) const;

	/// $ prefix, thousands separators, two decimals.
	static std::string currency(double value);

	/// "r_squared" -> "R Squared".
	static std::string metricLabel(const std::string &key);

	static std::string titleCase(const std::string &text);
};

/// Shorthand for DisplayFormatter().format(result).
std::string formatForDisplay(const engine::ForecastResult &result);

} // namespace quantforecast::report
