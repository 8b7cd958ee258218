#include <catch2/catch.hpp>

#include "quant-forecast/utils/regression.hpp"

#include <stdexcept>
#include <vector>

using quantforecast::utils::fitLine;

TEST_CASE("fitLine recovers an exact line", "[utils][regression]") {
	const auto fit = fitLine({10.0, 15.0, 20.0, 25.0, 30.0});
	REQUIRE(fit.slope == Catch::Detail::Approx(5.0));
	REQUIRE(fit.intercept == Catch::Detail::Approx(10.0));

	const auto fitted = fit.fitted(3);
	REQUIRE(fitted.size() == 3);
	REQUIRE(fitted[2] == Catch::Detail::Approx(20.0));

	const auto ahead = fit.extrapolate(5, 2);
	REQUIRE(ahead[0] == Catch::Detail::Approx(35.0));
	REQUIRE(ahead[1] == Catch::Detail::Approx(40.0));
}

TEST_CASE("fitLine minimizes squared error on noisy data", "[utils][regression]") {
	// x = 0..3, y = 1, 3, 2, 4 -> slope 0.8, intercept 1.3
	const auto fit = fitLine({1.0, 3.0, 2.0, 4.0});
	REQUIRE(fit.slope == Catch::Detail::Approx(0.8));
	REQUIRE(fit.intercept == Catch::Detail::Approx(1.3));
}

TEST_CASE("fitLine needs two points", "[utils][regression]") {
	REQUIRE_THROWS_AS(fitLine({1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(fitLine({}), std::invalid_argument);
}
