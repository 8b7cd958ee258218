#include <catch2/catch.hpp>

#include "quant-forecast/core/config.hpp"

#include <limits>
#include <stdexcept>

using quantforecast::core::ForecastConfig;

TEST_CASE("ForecastConfig defaults", "[core][config]") {
	const ForecastConfig config;
	REQUIRE(config.alpha == 0.3);
	REQUIRE(config.beta == 0.1);
	REQUIRE(config.min_data_points == 3);
	REQUIRE(config.max_forecast_horizon == 12);
	REQUIRE(config.max_season_length == 12);
	REQUIRE(config.trend_correlation_threshold == 0.3);
	REQUIRE(config.seasonality_min_length == 12);
	REQUIRE(config.min_length_for_smoothing == 6);
	REQUIRE(config.volatility_threshold == 50.0);
	REQUIRE(config.period_days == 30);
	REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("ForecastConfig validate rejects nonsensical values", "[core][config]") {
	SECTION("alpha out of range") {
		ForecastConfig config;
		config.alpha = 1.2;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("negative beta") {
		ForecastConfig config;
		config.beta = -0.1;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("zero minimum data points") {
		ForecastConfig config;
		config.min_data_points = 0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("single minimum data point") {
		ForecastConfig config;
		config.min_data_points = 1;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("non-positive horizon cap") {
		ForecastConfig config;
		config.max_forecast_horizon = 0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("zero season length cap") {
		ForecastConfig config;
		config.max_season_length = 0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("NaN volatility threshold") {
		ForecastConfig config;
		config.volatility_threshold = std::numeric_limits<double>::quiet_NaN();
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
	SECTION("zero day period") {
		ForecastConfig config;
		config.period_days = 0;
		REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	}
}
