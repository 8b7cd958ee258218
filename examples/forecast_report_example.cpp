#include "quant-forecast/core/errors.hpp"
#include "quant-forecast/data/table.hpp"
#include "quant-forecast/engine/forecast_engine.hpp"
#include "quant-forecast/report/display_formatter.hpp"
#include "quant-forecast/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace quantforecast;

namespace {

// Two years of monthly revenue: steady growth with a mid-year peak.
std::vector<double> monthlyRevenue() {
	constexpr double kPi = 3.14159265358979323846;
	std::vector<double> revenue;
	revenue.reserve(24);
	for (int month = 0; month < 24; ++month) {
		const double trend = 120000.0 + 1800.0 * month;
		const double season = 9000.0 * std::sin(2.0 * kPi * month / 12.0);
		revenue.push_back(std::round((trend + season) * 100.0) / 100.0);
	}
	return revenue;
}

std::vector<std::optional<std::string>> monthStarts(int first_year, std::size_t count) {
	std::vector<std::optional<std::string>> dates;
	dates.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		std::ostringstream out;
		out << first_year + static_cast<int>(i / 12) << '-' << std::setw(2) << std::setfill('0') << (i % 12) + 1
		    << "-01";
		dates.emplace_back(out.str());
	}
	return dates;
}

void printHeader(const std::string &title) {
	std::cout << "\n" << std::string(60, '=') << "\n";
	std::cout << title << "\n";
	std::cout << std::string(60, '=') << "\n\n";
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const auto revenue = monthlyRevenue();
	data::Table table;
	table.addColumn(data::Column::text("month", monthStarts(2022, revenue.size())));
	table.addColumn(data::Column::numeric("revenue", revenue));

	const engine::ForecastEngine engine;

	try {
		printHeader("Automatic method selection");
		const auto result = engine.analyze(table, "revenue", "month", 6);
		std::cout << report::formatForDisplay(result) << "\n";

		printHeader("Wider interval at 99% confidence");
		const auto wide = engine.analyze(table, "revenue", "month", 6, 0.99);
		std::cout << report::formatForDisplay(wide) << "\n";

		printHeader("Rejected request");
		engine.analyze(table, "profit", "month", 6);
	} catch (const core::ValidationError &e) {
		std::cout << "Validation failed: " << e.what() << "\n";
	} catch (const core::ForecastError &e) {
		std::cerr << "Forecast failed: " << e.what() << "\n";
		return 1;
	}

	return 0;
}
