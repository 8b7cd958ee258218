#include <catch2/catch.hpp>

#include "quant-forecast/utils/metrics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using quantforecast::utils::AccuracyMetrics;
using quantforecast::utils::Metrics;

TEST_CASE("Metrics compute standard error measures", "[utils][metrics]") {
	const std::vector<double> actual{1.0, 2.0, 3.0, 4.0};
	const std::vector<double> predicted{1.5, 1.5, 3.5, 3.0};

	REQUIRE(Metrics::mae(actual, predicted) == Catch::Detail::Approx(0.625));
	REQUIRE(Metrics::mse(actual, predicted) == Catch::Detail::Approx(0.4375));
	REQUIRE(Metrics::rmse(actual, predicted) == Catch::Detail::Approx(std::sqrt(0.4375)));
	REQUIRE(Metrics::r2(actual, predicted) == Catch::Detail::Approx(1.0 - 1.75 / 5.0));
}

TEST_CASE("Metrics r2 is zero for constant actuals", "[utils][metrics]") {
	const std::vector<double> actual{42.0, 42.0, 42.0};
	REQUIRE(Metrics::r2(actual, {41.0, 42.0, 43.0}) == 0.0);
	REQUIRE(Metrics::r2(actual, actual) == 0.0);
}

TEST_CASE("Metrics residuals keep sign", "[utils][metrics]") {
	const auto residuals = Metrics::residuals({3.0, 1.0}, {1.0, 2.0});
	REQUIRE(residuals == std::vector<double>{2.0, -1.0});
}

TEST_CASE("Metrics validate inputs", "[utils][metrics]") {
	REQUIRE_THROWS_AS(Metrics::mae({1.0, 2.0}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::rmse({}, {}), std::invalid_argument);
	REQUIRE_THROWS_AS(Metrics::residuals({1.0}, {}), std::invalid_argument);
}

TEST_CASE("AccuracyMetrics keeps insertion order and replaces in place", "[utils][metrics]") {
	AccuracyMetrics metrics;
	REQUIRE(metrics.method_confidence == quantforecast::core::MethodConfidence::Medium);

	metrics.set("r_squared", 0.9);
	metrics.set("mae", 1.0);
	metrics.set("r_squared", 0.8);

	REQUIRE(metrics.size() == 2);
	REQUIRE(metrics.values.front().first == "r_squared");
	REQUIRE(metrics.get("r_squared") == 0.8);
	REQUIRE(metrics.contains("mae"));
	REQUIRE_FALSE(metrics.get("rmse").has_value());
}
