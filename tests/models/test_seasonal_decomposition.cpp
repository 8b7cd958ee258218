#include <catch2/catch.hpp>

#include "common/time_series_helpers.hpp"
#include "quant-forecast/models/seasonal_decomposition.hpp"

#include <stdexcept>
#include <vector>

using quantforecast::models::SeasonalDecompositionBuilder;

TEST_CASE("Seasonal pattern is the mean deviation per cycle position", "[models][seasonal]") {
	const auto pattern = quantforecast::models::seasonalPattern({1.0, 5.0, 3.0, 7.0}, 2);
	REQUIRE(pattern.size() == 2);
	REQUIRE(pattern[0] == Catch::Detail::Approx(-2.0));
	REQUIRE(pattern[1] == Catch::Detail::Approx(2.0));

	const auto adjusted = quantforecast::models::deseasonalize({1.0, 5.0, 3.0, 7.0}, pattern);
	REQUIRE(adjusted == std::vector<double>{3.0, 3.0, 5.0, 5.0});

	REQUIRE_THROWS_AS(quantforecast::models::seasonalPattern({1.0}, 0), std::invalid_argument);
	REQUIRE_THROWS_AS(quantforecast::models::seasonalPattern({1.0}, 2), std::invalid_argument);
	REQUIRE_THROWS_AS(quantforecast::models::deseasonalize({1.0}, {}), std::invalid_argument);
}

TEST_CASE("Season length is capped at half the series", "[models][seasonal]") {
	auto model = SeasonalDecompositionBuilder().build();
	model->fit(tests::helpers::makeUnivariateSeries(tests::helpers::cosineSeries(100.0, 10.0, 4, 10)));
	REQUIRE(model->seasonLength() == 5);

	auto capped = SeasonalDecompositionBuilder().withMaxSeasonLength(4).build();
	capped->fit(tests::helpers::makeUnivariateSeries(tests::helpers::cosineSeries(100.0, 10.0, 4, 24)));
	REQUIRE(capped->seasonLength() == 4);
}

TEST_CASE("Seasonal forecast continues the cycle", "[models][seasonal][forecast]") {
	auto model = SeasonalDecompositionBuilder().withMaxSeasonLength(4).build();
	model->fit(tests::helpers::makeUnivariateSeries(tests::helpers::cosineSeries(100.0, 10.0, 4, 8)));

	REQUIRE(model->pattern()[0] == Catch::Detail::Approx(10.0));
	REQUIRE(model->trendLine().slope == Catch::Detail::Approx(0.0).margin(1e-9));

	// Step h sits at cycle position (n - 1 + h) mod 4 with n = 8.
	const auto forecast = model->predict(4);
	REQUIRE(forecast.primary()[0] == Catch::Detail::Approx(110.0));
	REQUIRE(forecast.primary()[1] == Catch::Detail::Approx(100.0).margin(1e-9));
	REQUIRE(forecast.primary()[2] == Catch::Detail::Approx(90.0));
	REQUIRE(forecast.primary()[3] == Catch::Detail::Approx(100.0).margin(1e-9));
}

TEST_CASE("Seasonal model adds the pattern to a trend", "[models][seasonal][forecast]") {
	std::vector<double> values;
	for (int i = 0; i < 12; ++i) {
		values.push_back(50.0 + 3.0 * i + (i % 3 == 0 ? 6.0 : -3.0));
	}
	auto model = SeasonalDecompositionBuilder().withMaxSeasonLength(3).build();
	model->fit(tests::helpers::makeUnivariateSeries(values));

	REQUIRE(model->trendLine().slope > 2.0);
	const auto forecast = model->predict(3);
	REQUIRE(forecast.primary()[0] > values.back());
	// Position 12 opens a new cycle, which carries the positive pattern term.
	REQUIRE(forecast.primary()[0] - model->trendLine().at(12.0) == Catch::Detail::Approx(model->pattern()[0]));
}

TEST_CASE("Seasonal model reports seasonal metadata", "[models][seasonal][metrics]") {
	auto model = SeasonalDecompositionBuilder().build();
	REQUIRE_THROWS_AS(model->predict(1), std::logic_error);
	REQUIRE_THROWS_AS(model->fit(tests::helpers::makeUnivariateSeries({1.0})), std::invalid_argument);
	REQUIRE_THROWS_AS(SeasonalDecompositionBuilder().withMaxSeasonLength(0).build(), std::invalid_argument);

	model->fit(tests::helpers::makeUnivariateSeries(tests::helpers::cosineSeries(100.0, 10.0, 12, 24)));
	REQUIRE(model->seasonalDetected());
	REQUIRE(model->trendDirection() == quantforecast::core::TrendDirection::Seasonal);

	const auto metrics = model->accuracy();
	REQUIRE(metrics.contains("mae"));
	REQUIRE(metrics.contains("rmse"));
	REQUIRE(*metrics.get("seasonal_strength") > 5.0);
	REQUIRE(metrics.method_confidence == quantforecast::core::MethodConfidence::High);
}
