#include <catch2/catch.hpp>

#include "tabstat/core/errors.hpp"
#include "tabstat/models/correlation.hpp"
#include "common/table_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace tabstat;
using tabstat::models::CorrelationEngine;
using tabstat::models::CorrelationOrder;
using tabstat::models::CorrelationStrength;
using tabstat::models::classifyCorrelation;

TEST_CASE("Perfectly proportional columns correlate at exactly one", "[models][correlation]") {
	const auto cleaned = tests::helpers::makeCleaned({{"a", {1.0, 2.0, 3.0}}, {"b", {2.0, 4.0, 6.0}}});
	const auto matrix = CorrelationEngine::correlate(cleaned);

	REQUIRE(matrix.size() == 2);
	REQUIRE(matrix.observations() == 3);
	REQUIRE(matrix.at("a", "b") == 1.0);
	REQUIRE(matrix.at("b", "a") == 1.0);
	REQUIRE(matrix.zeroVarianceColumns().empty());
}

TEST_CASE("Correlation matrix is symmetric with a unit diagonal", "[models][correlation]") {
	const auto cleaned = tests::helpers::makeCleaned({
	    {"x", {1.0, 2.0, 3.0, 4.0, 5.0, 6.0}},
	    {"y", {2.0, 1.0, 4.0, 3.0, 6.0, 5.0}},
	    {"z", {9.0, 7.0, 8.0, 3.0, 2.0, 1.0}},
	});
	const auto matrix = CorrelationEngine::correlate(cleaned);
	const auto &values = matrix.values();

	for (Eigen::Index i = 0; i < values.rows(); ++i) {
		REQUIRE(values(i, i) == 1.0);
		for (Eigen::Index j = 0; j < values.cols(); ++j) {
			REQUIRE(values(i, j) == values(j, i));
			REQUIRE(std::abs(values(i, j)) <= 1.0);
		}
	}
	// Cross deviations sum to 14.5; both columns have 17.5.
	REQUIRE(matrix.at("x", "y") == Catch::Detail::Approx(14.5 / 17.5));
	REQUIRE(matrix.at("x", "z") < -0.7);
}

TEST_CASE("Zero-variance columns give NaN cells and are reported", "[models][correlation]") {
	const auto cleaned = tests::helpers::makeCleaned({{"a", {1.0, 2.0, 3.0}}, {"flat", {5.0, 5.0, 5.0}}});
	const auto matrix = CorrelationEngine::correlate(cleaned);

	REQUIRE(std::isnan(matrix.at("a", "flat")));
	REQUIRE(std::isnan(matrix.at("flat", "a")));
	REQUIRE(matrix.at("flat", "flat") == 1.0);
	REQUIRE(matrix.zeroVarianceColumns() == std::vector<std::string>{"flat"});
}

TEST_CASE("Correlation needs two columns and a row", "[models][correlation]") {
	REQUIRE_THROWS_AS(CorrelationEngine::correlate(tests::helpers::makeCleaned({{"a", {1.0, 2.0}}})),
	                  InsufficientDataError);
	REQUIRE_THROWS_AS(CorrelationEngine::correlate(tests::helpers::makeCleaned({{"a", {}}, {"b", {}}})),
	                  InsufficientDataError);

	const auto matrix = CorrelationEngine::correlate(tests::helpers::makeCleaned({{"a", {1.0, 2.0}}, {"b", {3.0, 1.0}}}));
	REQUIRE_THROWS_AS(matrix.at("a", "c"), MissingColumnError);
}

TEST_CASE("Columns can be presented in several orders", "[models][correlation]") {
	const auto cleaned = tests::helpers::makeCleaned({
	    {"noise", {1.0, -1.0, 1.0, -1.0, 1.0}},
	    {"beta", {1.0, 2.0, 3.0, 4.0, 5.0}},
	    {"alpha", {2.0, 4.1, 5.9, 8.2, 9.9}},
	});
	const auto matrix = CorrelationEngine::correlate(cleaned);

	REQUIRE(matrix.orderedColumns(CorrelationOrder::Input) == std::vector<std::string>{"noise", "beta", "alpha"});
	REQUIRE(matrix.orderedColumns(CorrelationOrder::Alphabetical) ==
	        std::vector<std::string>{"alpha", "beta", "noise"});
	REQUIRE(matrix.orderedColumns(CorrelationOrder::MeanAbsolute).back() == "noise");

	const auto sorted = matrix.reordered(CorrelationOrder::Alphabetical);
	REQUIRE(sorted.columns().front() == "alpha");
	REQUIRE(sorted.at("alpha", "noise") == matrix.at("alpha", "noise"));
	REQUIRE(sorted.values()(0, 0) == 1.0);
}

TEST_CASE("Coefficients are bucketed by strength", "[models][correlation]") {
	REQUIRE(classifyCorrelation(0.9) == CorrelationStrength::StrongPositive);
	REQUIRE(classifyCorrelation(0.5) == CorrelationStrength::ModeratePositive);
	REQUIRE(classifyCorrelation(0.3) == CorrelationStrength::Weak);
	REQUIRE(classifyCorrelation(-0.1) == CorrelationStrength::Weak);
	REQUIRE(classifyCorrelation(-0.5) == CorrelationStrength::ModerateNegative);
	REQUIRE(classifyCorrelation(-0.75) == CorrelationStrength::StrongNegative);
	REQUIRE(classifyCorrelation(std::nan("")) == CorrelationStrength::Undefined);
	REQUIRE(toString(CorrelationStrength::StrongNegative) == "strong negative");
}
