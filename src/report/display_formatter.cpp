#include "quant-forecast/report/display_formatter.hpp"

#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace quantforecast::report {

namespace {

std::string fixed(double value, int decimals) {
	std::ostringstream out;
	out.imbue(std::locale::classic());
	out << std::fixed << std::setprecision(decimals) << value;
	return out.str();
}

} // namespace

std::string DisplayFormatter::currency(double value) {
	std::string digits = fixed(value, 2);

	std::string sign;
	if (!digits.empty() && digits.front() == '-') {
		sign = "-";
		digits.erase(0, 1);
	}

	const auto dot = digits.find('.');
	std::string whole = digits.substr(0, dot);
	const std::string fraction = dot == std::string::npos ? std::string() : digits.substr(dot);

	std::string grouped;
	int count = 0;
	for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
		if (count > 0 && count % 3 == 0) {
			grouped.insert(grouped.begin(), ',');
		}
		grouped.insert(grouped.begin(), *it);
		++count;
	}
	return "$" + sign + grouped + fraction;
}

std::string DisplayFormatter::titleCase(const std::string &text) {
	std::string result = text;
	bool word_start = true;
	for (auto &ch : result) {
		const auto c = static_cast<unsigned char>(ch);
		if (std::isalpha(c)) {
			ch = static_cast<char>(word_start ? std::toupper(c) : std::tolower(c));
			word_start = false;
		} else {
			word_start = true;
		}
	}
	return result;
}

std::string DisplayFormatter::metricLabel(const std::string &key) {
	std::string spaced = key;
	for (auto &ch : spaced) {
		if (ch == '_') {
			ch = ' ';
		}
	}
	return titleCase(spaced);
}

std::string DisplayFormatter::format(const engine::ForecastResult &result) const {
	std::ostringstream out;
	out << "\xF0\x9F\x93\x88 **" << core::displayName(result.method) << " Forecast**\n\n";

	out << "**Forecast Summary:**\n";
	out << "• Method: " << core::displayName(result.method) << "\n";
	out << "• Periods: " << result.forecast_horizon << "\n";
	out << "• Trend: " << titleCase(core::toString(result.trend_direction)) << "\n";
	out << "• Seasonal: " << (result.seasonal_detected ? "Yes" : "No") << "\n";
	out << "• Last Value: " << currency(result.last_actual_value) << "\n\n";

	out << "**Forecast Values:**\n";
	for (std::size_t i = 0; i < result.forecast_values.size(); ++i) {
		out << "• " << result.forecast_dates.at(i) << ": " << currency(result.forecast_values[i]) << " ("
		    << currency(result.confidence_lower.at(i)) << " - " << currency(result.confidence_upper.at(i)) << ")\n";
	}

	out << "\n**Accuracy Metrics:**\n";
	for (const auto &entry : result.accuracy_metrics.values) {
		out << "• " << metricLabel(entry.first) << ": " << fixed(entry.second, 3) << "\n";
	}
	out << "• Method Confidence: " << core::toString(result.accuracy_metrics.method_confidence) << "\n";

	out << "\n**Key Insights:**\n";
	switch (result.trend_direction) {
	case core::TrendDirection::Increasing:
		out << "• Positive growth trend detected\n";
		break;
	case core::TrendDirection::Decreasing:
		out << "• Declining trend detected\n";
		break;
	case core::TrendDirection::Stable:
	case core::TrendDirection::Seasonal:
		out << "• Stable trend with minimal change\n";
		break;
	}
	if (result.seasonal_detected) {
		out << "• Seasonal patterns incorporated in forecast\n";
	}
	return out.str();
}

std::string formatForDisplay(const engine::ForecastResult &result) {
	return DisplayFormatter().format(result);
}

} // namespace quantforecast::report
