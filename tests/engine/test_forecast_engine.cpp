#include <catch2/catch.hpp>

#include "common/table_helpers.hpp"
#include "common/time_series_helpers.hpp"
#include "quant-forecast/core/errors.hpp"
#include "quant-forecast/engine/forecast_engine.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using namespace quantforecast;
using core::MethodVariant;
using engine::ForecastEngine;

namespace {

void requireConsistent(const engine::ForecastResult &result, int expected_horizon) {
	const auto horizon = static_cast<std::size_t>(expected_horizon);
	REQUIRE(result.forecast_horizon == expected_horizon);
	REQUIRE(result.forecast_values.size() == horizon);
	REQUIRE(result.forecast_dates.size() == horizon);
	REQUIRE(result.confidence_lower.size() == horizon);
	REQUIRE(result.confidence_upper.size() == horizon);
	for (std::size_t i = 0; i < horizon; ++i) {
		REQUIRE(result.confidence_lower[i] <= result.forecast_values[i]);
		REQUIRE(result.forecast_values[i] <= result.confidence_upper[i]);
	}
}

} // namespace

TEST_CASE("Engine output lengths match the clamped horizon", "[engine][analyze]") {
	const ForecastEngine engine;
	const auto table = tests::helpers::monthlyTable(tests::helpers::noisyLinearSeries(100.0, 4.0, 12));

	requireConsistent(engine.analyze(table, "sales", "date", 5), 5);
	requireConsistent(engine.analyze(table, "sales", "date", 12), 12);

	const auto clamped = engine.analyze(table, "sales", "date", 50);
	requireConsistent(clamped, 12);
	REQUIRE(clamped.forecast_horizon <= 12);
}

TEST_CASE("Engine dates follow the last observation", "[engine][analyze]") {
	const auto table = tests::helpers::monthlyTable(tests::helpers::noisyLinearSeries(100.0, 4.0, 12));
	const auto result = ForecastEngine().analyze(table, "sales", "date", 2);
	REQUIRE(result.forecast_dates == std::vector<std::string>{"2023-12-31", "2024-01-30"});
	REQUIRE(result.last_actual_value == Catch::Detail::Approx(100.0 + 4.0 * 11 - 1.0));
}

TEST_CASE("Engine rejects non-positive periods", "[engine][analyze]") {
	const ForecastEngine engine;
	const auto table = tests::helpers::monthlyTable({1.0, 2.0, 3.0});
	REQUIRE_THROWS_AS(engine.analyze(table, "sales", "date", 0), core::InsufficientDataError);
	REQUIRE_THROWS_AS(engine.analyze(table, "sales", "date", -4), core::InsufficientDataError);
	REQUIRE_THROWS_AS(engine.forecastWith(tests::helpers::makeUnivariateSeries({1.0, 2.0, 3.0}),
	                                      MethodVariant::LinearRegression, 0),
	                  core::InsufficientDataError);
}

TEST_CASE("Engine requires three usable rows", "[engine][analyze]") {
	const ForecastEngine engine;
	REQUIRE_THROWS_AS(engine.analyze(tests::helpers::monthlyTable({1.0, 2.0}), "sales", "date", 3),
	                  core::InsufficientDataError);
	REQUIRE_THROWS_AS(engine.forecastWith(tests::helpers::makeUnivariateSeries({1.0, 2.0}),
	                                      MethodVariant::SimpleExponentialSmoothing, 3),
	                  core::InsufficientDataError);
}

TEST_CASE("Engine passes validation errors through unchanged", "[engine][analyze]") {
	const ForecastEngine engine;
	const auto table = tests::helpers::monthlyTable({1.0, 2.0, 3.0});
	REQUIRE_THROWS_AS(engine.analyze(table, "profit", "date", 3), core::MissingColumnError);
	REQUIRE_THROWS_AS(engine.analyze(table, "date", "date", 3), core::NonNumericTargetError);
	REQUIRE_THROWS_AS(engine.analyze(data::Table(), "sales", "date", 3), core::EmptyInputError);
}

TEST_CASE("Engine reports numeric failures as ForecastError", "[engine][analyze]") {
	auto values = tests::helpers::linearSeries(10.0, 1.0, 8);
	values[4] = std::numeric_limits<double>::infinity();
	const auto table = tests::helpers::monthlyTable(values);
	REQUIRE_THROWS_AS(ForecastEngine().analyze(table, "sales", "date", 3), core::ForecastError);
}

TEST_CASE("Linear regression recovers 5i + 10", "[engine][linear_regression]") {
	const auto series = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(10.0, 5.0, 10));
	const auto result = ForecastEngine().forecastWith(series, MethodVariant::LinearRegression, 3);

	REQUIRE(result.method == MethodVariant::LinearRegression);
	REQUIRE(*result.accuracy_metrics.get("r_squared") == Catch::Detail::Approx(1.0));
	REQUIRE(result.forecast_values[0] == Catch::Detail::Approx(60.0));
	REQUIRE(result.forecast_values[1] - result.forecast_values[0] == Catch::Detail::Approx(5.0));
	REQUIRE(result.trend_direction == core::TrendDirection::Increasing);
}

TEST_CASE("Constant input forecasts the constant under every method", "[engine][constant]") {
	const ForecastEngine engine;
	const auto series = tests::helpers::makeUnivariateSeries(std::vector<double>(12, 42.0));
	const std::vector<MethodVariant> methods{MethodVariant::LinearRegression, MethodVariant::SimpleExponentialSmoothing,
	                                         MethodVariant::DoubleExponentialSmoothing,
	                                         MethodVariant::SeasonalDecomposition};

	for (auto method : methods) {
		const auto result = engine.forecastWith(series, method, 4);
		REQUIRE(result.method == method);
		requireConsistent(result, 4);
		for (std::size_t i = 0; i < result.forecast_values.size(); ++i) {
			REQUIRE(result.forecast_values[i] == Catch::Detail::Approx(42.0));
			REQUIRE(result.confidence_upper[i] - result.confidence_lower[i] == Catch::Detail::Approx(0.0).margin(1e-6));
		}
	}
}

TEST_CASE("Higher confidence never narrows the interval", "[engine][intervals]") {
	const ForecastEngine engine;
	const auto table = tests::helpers::monthlyTable(tests::helpers::noisyLinearSeries(100.0, 4.0, 12));
	const auto r95 = engine.analyze(table, "sales", "date", 4, 0.95);
	const auto r99 = engine.analyze(table, "sales", "date", 4, 0.99);

	REQUIRE(r95.method == r99.method);
	for (std::size_t i = 0; i < r95.forecast_values.size(); ++i) {
		REQUIRE(r99.confidence_upper[i] - r99.confidence_lower[i] >=
		        r95.confidence_upper[i] - r95.confidence_lower[i]);
	}
}

TEST_CASE("Identical calls give identical results", "[engine][determinism]") {
	const ForecastEngine engine;
	const auto table = tests::helpers::monthlyTable(tests::helpers::cosineSeries(200.0, 25.0, 6, 18));
	const auto first = engine.analyze(table, "sales", "date", 6);
	const auto second = engine.analyze(table, "sales", "date", 6);

	REQUIRE(first.method == second.method);
	REQUIRE(first.forecast_values == second.forecast_values);
	REQUIRE(first.confidence_lower == second.confidence_lower);
	REQUIRE(first.confidence_upper == second.confidence_upper);
	REQUIRE(first.forecast_dates == second.forecast_dates);
	REQUIRE(first.accuracy_metrics.values == second.accuracy_metrics.values);
}

TEST_CASE("Engine routes series to the expected method", "[engine][routing]") {
	const ForecastEngine engine;

	SECTION("three rows use linear regression") {
		const auto result = engine.analyze(tests::helpers::monthlyTable({10.0, 15.0, 20.0}), "sales", "date", 2);
		REQUIRE(result.method == MethodVariant::LinearRegression);
		REQUIRE(result.forecast_values[0] == Catch::Detail::Approx(25.0));
	}
	SECTION("calm linear trend uses double exponential smoothing") {
		const auto table = tests::helpers::monthlyTable(tests::helpers::linearSeries(100.0, 2.0, 12));
		const auto result = engine.analyze(table, "sales", "date", 3);
		REQUIRE(result.method == MethodVariant::DoubleExponentialSmoothing);
		REQUIRE(result.trend_direction == core::TrendDirection::Increasing);
	}
	SECTION("trendless cycle uses seasonal decomposition") {
		const auto table = tests::helpers::monthlyTable(tests::helpers::cosineSeries(100.0, 10.0, 12, 12));
		const auto result = engine.analyze(table, "sales", "date", 3);
		REQUIRE(result.method == MethodVariant::SeasonalDecomposition);
		REQUIRE(result.seasonal_detected);
		REQUIRE(result.trend_direction == core::TrendDirection::Seasonal);
	}
	SECTION("short trendless series uses simple exponential smoothing") {
		const auto table = tests::helpers::monthlyTable({5.0, 1.0, 5.0, 1.0, 5.0, 1.0, 5.0});
		const auto result = engine.analyze(table, "sales", "date", 3);
		REQUIRE(result.method == MethodVariant::SimpleExponentialSmoothing);
		REQUIRE(result.trend_direction == core::TrendDirection::Stable);
	}
}

TEST_CASE("Engine honours its configuration", "[engine][config]") {
	core::ForecastConfig config;
	config.max_forecast_horizon = 3;
	config.period_days = 7;
	const ForecastEngine engine(config);

	const auto series = tests::helpers::makeUnivariateSeries({1.0, 2.0, 4.0, 3.0, 5.0});
	const auto result = engine.forecastWith(series, MethodVariant::SimpleExponentialSmoothing, 10);
	requireConsistent(result, 3);
	REQUIRE(result.forecast_dates.front() == "2023-01-12");

	core::ForecastConfig broken;
	broken.alpha = 2.0;
	REQUIRE_THROWS_AS(ForecastEngine(broken), std::invalid_argument);
}

TEST_CASE("Engine needs at least two rows to fit a trend", "[engine][config]") {
	core::ForecastConfig single_row;
	single_row.min_data_points = 1;
	REQUIRE_THROWS_AS(ForecastEngine(single_row), std::invalid_argument);

	core::ForecastConfig two_rows;
	two_rows.min_data_points = 2;
	const ForecastEngine engine(two_rows);
	const auto result = engine.analyze(tests::helpers::monthlyTable({10.0, 14.0}), "sales", "date", 2);
	requireConsistent(result, 2);
	REQUIRE(result.method == MethodVariant::LinearRegression);
	REQUIRE(result.forecast_values[0] == Catch::Detail::Approx(18.0));
	REQUIRE_THROWS_AS(engine.analyze(tests::helpers::monthlyTable({10.0}), "sales", "date", 2),
	                  core::InsufficientDataError);
}

TEST_CASE("Engine exposes intermediate stages", "[engine][stages]") {
	const ForecastEngine engine;
	const auto series = tests::helpers::makeUnivariateSeries(tests::helpers::linearSeries(100.0, 2.0, 12));
	const auto chars = engine.characterize(series);
	REQUIRE(chars.length == 12);
	REQUIRE(chars.has_trend);
	REQUIRE(engine.selectMethod(chars) == MethodVariant::DoubleExponentialSmoothing);
}
