#include <catch2/catch.hpp>

#include "tabstat/core/errors.hpp"
#include "tabstat/models/linear_regression.hpp"
#include "tabstat/utils/distributions.hpp"
#include "tabstat/utils/logging.hpp"
#include "common/table_helpers.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tabstat;
using tabstat::models::LinearRegression;

TEST_CASE("OLS recovers an exact linear relation", "[models][ols]") {
	const auto cleaned =
	    tests::helpers::makeCleaned({{"x", {1.0, 2.0, 3.0, 4.0, 5.0}}, {"y", {5.0, 7.0, 9.0, 11.0, 13.0}}});

	LinearRegression regression;
	const auto &result = regression.fit(cleaned, "y", {"x"});

	REQUIRE(result.terms == std::vector<std::string>{"const", "x"});
	REQUIRE(result.coefficient("const") == Catch::Detail::Approx(3.0).margin(1e-10));
	REQUIRE(result.coefficient("x") == Catch::Detail::Approx(2.0).margin(1e-10));
	REQUIRE(result.r_squared == Catch::Detail::Approx(1.0).margin(1e-12));
	REQUIRE(result.rmse == Catch::Detail::Approx(0.0).margin(1e-10));

	const auto named = result.namedCoefficients();
	REQUIRE(named.front().first == "const");
	REQUIRE(named.back().first == "x");
}

TEST_CASE("OLS reports the summary statistics", "[models][ols]") {
	const auto cleaned =
	    tests::helpers::makeCleaned({{"x", {1.0, 2.0, 3.0, 4.0, 5.0}}, {"y", {2.0, 4.0, 5.0, 4.0, 5.0}}});

	LinearRegression regression;
	const auto &result = regression.fit(cleaned, "y", {"x"});

	REQUIRE(result.coefficient("const") == Catch::Detail::Approx(2.2));
	REQUIRE(result.coefficient("x") == Catch::Detail::Approx(0.6));
	REQUIRE(result.ss_tot == Catch::Detail::Approx(6.0));
	REQUIRE(result.ss_res == Catch::Detail::Approx(2.4));
	REQUIRE(result.r_squared == Catch::Detail::Approx(0.6));
	REQUIRE(result.adj_r_squared == Catch::Detail::Approx(1.0 - 0.4 * 4.0 / 3.0));
	REQUIRE(result.f_statistic == Catch::Detail::Approx(4.5));
	REQUIRE(result.f_pvalue == Catch::Detail::Approx(utils::Distributions::tTwoSided(std::sqrt(4.5), 3.0)));
	REQUIRE(result.rmse == Catch::Detail::Approx(std::sqrt(2.4 / 5.0)));

	REQUIRE(result.n_obs == 5);
	REQUIRE(result.df_model == 1);
	REQUIRE(result.df_resid == 3);

	// se(slope) = sqrt(sigma^2 / Sxx) with sigma^2 = 0.8 and Sxx = 10
	REQUIRE(result.std_errors(1) == Catch::Detail::Approx(std::sqrt(0.08)));
	REQUIRE(result.t_values(1) == Catch::Detail::Approx(0.6 / std::sqrt(0.08)));
	REQUIRE(result.p_values(1) == Catch::Detail::Approx(result.f_pvalue));

	const double ll = -2.5 * (std::log(2.0 * 3.14159265358979323846 * 2.4 / 5.0) + 1.0);
	REQUIRE(result.log_likelihood == Catch::Detail::Approx(ll));
	REQUIRE(result.aic == Catch::Detail::Approx(-2.0 * ll + 4.0));

	REQUIRE(result.fitted.size() == 5);
	REQUIRE(result.residuals[0] == Catch::Detail::Approx(-0.8));

	const auto predicted = regression.predict(Eigen::MatrixXd::Constant(1, 1, 10.0));
	REQUIRE(predicted.size() == 1);
	REQUIRE(predicted[0] == Catch::Detail::Approx(8.2));
}

TEST_CASE("A constant target leaves R squared undefined", "[models][ols]") {
	const auto cleaned = tests::helpers::makeCleaned({{"x", {1.0, 2.0, 3.0, 4.0}}, {"y", {7.0, 7.0, 7.0, 7.0}}});

	LinearRegression regression;
	const auto &result = regression.fit(cleaned, "y", {"x"});
	REQUIRE(std::isnan(result.r_squared));
	REQUIRE(std::isnan(result.adj_r_squared));
	REQUIRE(std::isnan(result.f_statistic));
	REQUIRE(std::isnan(result.f_pvalue));
	REQUIRE(result.coefficient("const") == Catch::Detail::Approx(7.0));
}

TEST_CASE("A constant target is only reported at debug level", "[models][ols][logging]") {
	const auto cleaned = tests::helpers::makeCleaned({{"x", {1.0, 2.0, 3.0, 4.0}}, {"y", {7.0, 7.0, 7.0, 7.0}}});
	auto &logger = utils::Logging::getLogger();
	auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
	logger->sinks().push_back(sink);

	utils::Logging::init();
	LinearRegression().fit(cleaned, "y", {"x"});
	const bool silent_by_default = sink->last_formatted().empty();

	utils::Logging::init(spdlog::level::debug);
	LinearRegression().fit(cleaned, "y", {"x"});
	const auto records = sink->last_formatted();

	logger->sinks().pop_back();
	utils::Logging::init();

	REQUIRE(silent_by_default);
	REQUIRE(records.size() >= 1);
	bool mentions_constant = false;
	for (const auto &record : records) {
		mentions_constant = mentions_constant || record.find("target is constant") != std::string::npos;
	}
	REQUIRE(mentions_constant);
}

TEST_CASE("OLS rejects underdetermined and degenerate designs", "[models][ols]") {
	LinearRegression regression;

	const auto two_rows = tests::helpers::makeCleaned({{"x", {1.0, 2.0}}, {"y", {3.0, 5.0}}});
	REQUIRE_THROWS_AS(regression.fit(two_rows, "y", {"x"}), UnderdeterminedSystemError);

	const auto collinear = tests::helpers::makeCleaned(
	    {{"a", {1.0, 2.0, 3.0, 4.0, 5.0}}, {"b", {2.0, 4.0, 6.0, 8.0, 10.0}}, {"y", {1.0, 3.0, 2.0, 5.0, 4.0}}});
	REQUIRE_THROWS_AS(regression.fit(collinear, "y", {"a", "b"}), UnderdeterminedSystemError);

	const auto constant_feature =
	    tests::helpers::makeCleaned({{"a", {1.0, 1.0, 1.0, 1.0}}, {"y", {1.0, 3.0, 2.0, 5.0}}});
	REQUIRE_THROWS_AS(regression.fit(constant_feature, "y", {"a"}), UnderdeterminedSystemError);

	const auto empty = tests::helpers::makeCleaned({{"x", {}}, {"y", {}}});
	REQUIRE_THROWS_AS(regression.fit(empty, "y", {"x"}), InsufficientDataError);
}

TEST_CASE("OLS validates the requested terms", "[models][ols]") {
	const auto cleaned = tests::helpers::makeCleaned({{"x", {1.0, 2.0, 3.0, 4.0}}, {"y", {1.0, 3.0, 2.0, 5.0}}});
	LinearRegression regression;

	REQUIRE_THROWS_AS(regression.fit(cleaned, "y", {}), InvalidParameterError);
	REQUIRE_THROWS_AS(regression.fit(cleaned, "y", {"x", "y"}), InvalidParameterError);
	REQUIRE_THROWS_AS(regression.fit(cleaned, "y", {"x", "x"}), InvalidParameterError);
	REQUIRE_THROWS_AS(regression.fit(cleaned, "y", {"z"}), MissingColumnError);
	REQUIRE_THROWS_AS(regression.result(), std::logic_error);
	REQUIRE_FALSE(regression.isFitted());
}
