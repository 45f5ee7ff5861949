#include <catch2/catch.hpp>

#include "tabstat/analyzer.hpp"
#include "tabstat/utils/logging.hpp"
#include "common/table_helpers.hpp"

#include <string>
#include <vector>

using namespace tabstat;
using tabstat::core::Row;
using tabstat::core::calendar::formatIso;

namespace {

core::Table linearTable() {
	std::vector<Row> rows;
	for (int i = 1; i <= 8; ++i) {
		const double x = static_cast<double>(i);
		rows.push_back(Row{{"x", x}, {"y", 2.0 * x + 3.0}, {"z", std::to_string(i % 3)}});
	}
	rows.push_back(Row{{"x", std::string("oops")}, {"y", 1.0}});
	rows.push_back(Row{{"x", 9.0}});
	return tests::helpers::makeTable(std::move(rows));
}

core::Table junkTable() {
	return tests::helpers::makeTable({
	    Row{{"date", std::string("never")}, {"a", std::string("x")}, {"b", std::string("y")}},
	    Row{{"date", std::string("2024-01-02")}, {"a", std::string("")}, {"b", 1.0}},
	});
}

} // namespace

TEST_CASE("Analyzer correlates proportional columns", "[integration][analyzer]") {
	const auto table = tests::helpers::makeTable({
	    Row{{"a", 1.0}, {"b", 2.0}},
	    Row{{"a", 2.0}, {"b", 4.0}},
	    Row{{"a", 3.0}, {"b", 6.0}},
	});

	const Analyzer analyzer;
	const auto matrix = analyzer.correlate(table, {"a", "b"});
	REQUIRE(matrix.at("a", "b") == Catch::Detail::Approx(1.0));
	REQUIRE(matrix.at("b", "a") == Catch::Detail::Approx(1.0));

	const auto all = analyzer.correlate(table);
	REQUIRE(all.size() == 2);
}

TEST_CASE("Analyzer fits OLS on the rows that survive cleaning", "[integration][analyzer]") {
	const Analyzer analyzer;
	const auto result = analyzer.fitOls(linearTable(), "y", {"x"});

	REQUIRE(result.n_obs == 8);
	REQUIRE(result.coefficient("const") == Catch::Detail::Approx(3.0).margin(1e-9));
	REQUIRE(result.coefficient("x") == Catch::Detail::Approx(2.0).margin(1e-9));

	REQUIRE_THROWS_AS(analyzer.fitOls(linearTable(), "y", {"revenue"}), MissingColumnError);
	REQUIRE_THROWS_AS(analyzer.fitOls(linearTable(), "y", {"y"}), InvalidParameterError);
}

TEST_CASE("Analyzer forests are reproducible for a fixed seed", "[integration][analyzer]") {
	AnalysisConfig config;
	config.setSeed(99).setTrees(15).setMaxFeaturesFraction(1.0);

	const Analyzer first(config);
	const Analyzer second(config.setThreads(1));

	const auto a = first.fitForest(linearTable(), "y", {"x", "z"});
	const auto b = second.fitForest(linearTable(), "y", {"x", "z"});
	REQUIRE(a.n_trees == 15);
	REQUIRE(a.fitted == b.fitted);
	REQUIRE(a.importances == b.importances);
	REQUIRE(a.importance("x") > a.importance("z"));

	REQUIRE(first.fitForest(linearTable(), "y", {"x"}, 3).n_trees == 3);
	REQUIRE_THROWS_AS(first.fitForest(linearTable(), "y", {"x"}, 0), InvalidParameterError);
}

TEST_CASE("Analyzer forecasts from a table with text dates", "[integration][analyzer]") {
	const auto table = tests::helpers::makeTable({
	    Row{{"date", std::string("2024-01-03")}, {"value", 30.0}},
	    Row{{"date", std::string("2024-01-01")}, {"value", 10.0}},
	    Row{{"date", std::string("2024-01-02")}, {"value", std::string("20")}},
	    Row{{"date", std::string("not a date")}, {"value", 99.0}},
	});

	const Analyzer analyzer;
	const auto result = analyzer.forecast(table, "date", "value", 2, "simple-trend");
	REQUIRE(result.forecast.point[0] == Catch::Detail::Approx(40.0));
	REQUIRE(result.forecast.point[1] == Catch::Detail::Approx(50.0));
	REQUIRE(formatIso(result.forecast.timestamps[0]) == "2024-01-04");
	REQUIRE(formatIso(result.forecast.timestamps[1]) == "2024-01-05");

	REQUIRE_THROWS_AS(analyzer.forecast(table, "date", "value", 0, "arima"), InvalidParameterError);
	REQUIRE_THROWS_AS(analyzer.forecast(table, "date", "value", 2, "garch"), InvalidParameterError);
	REQUIRE_THROWS_AS(analyzer.forecast(table, "when", "value", 2, "arima"), MissingColumnError);
}

TEST_CASE("Analyzer applies the configured duplicate policy", "[integration][analyzer]") {
	const auto table = tests::helpers::makeTable({
	    Row{{"date", std::string("2024-01-01")}, {"value", 10.0}},
	    Row{{"date", std::string("2024-01-02")}, {"value", 18.0}},
	    Row{{"date", std::string("2024-01-02")}, {"value", 22.0}},
	    Row{{"date", std::string("2024-01-03")}, {"value", 30.0}},
	});

	const Analyzer averaging;
	const auto result = averaging.forecast(table, "date", "value", 1, "linear");
	REQUIRE(result.forecast.point[0] == Catch::Detail::Approx(40.0));

	AnalysisConfig config;
	config.setDuplicatePolicy(cleaning::DuplicateTimestampPolicy::Preserve);
	const Analyzer preserving(config);
	REQUIRE_THROWS_AS(preserving.forecast(table, "date", "value", 1, "linear"), InvalidParameterError);
}

TEST_CASE("An empty cleaned table is reported as insufficient data", "[integration][analyzer]") {
	const Analyzer analyzer;
	const auto table = junkTable();

	REQUIRE(analyzer.clean(table, {"a", "b"}).empty());
	REQUIRE_THROWS_AS(analyzer.correlate(table, {"a", "b"}), InsufficientDataError);
	REQUIRE_THROWS_AS(analyzer.fitOls(table, "a", {"b"}), InsufficientDataError);
	REQUIRE_THROWS_AS(analyzer.fitForest(table, "a", {"b"}), InsufficientDataError);
	REQUIRE_THROWS_AS(analyzer.forecast(table, "date", "a", 3, "arima"), InsufficientDataError);
}

TEST_CASE("Analyzer applies a configured log level", "[integration][analyzer]") {
	AnalysisConfig config;
	config.setLogLevel(spdlog::level::err);
	const Analyzer analyzer(config);
	REQUIRE(utils::Logging::getLogger()->level() == spdlog::level::err);

	utils::Logging::init();
	REQUIRE(utils::Logging::getLogger()->level() == spdlog::level::warn);
}
