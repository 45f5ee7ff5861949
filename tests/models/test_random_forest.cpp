#include <catch2/catch.hpp>

#include "tabstat/core/errors.hpp"
#include "tabstat/models/random_forest.hpp"
#include "common/table_helpers.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace tabstat;
using tabstat::models::ForestOptions;
using tabstat::models::RandomForest;

namespace {

// y follows x1 closely; x2 is an unrelated sawtooth.
cleaning::CleanedTable signalTable(std::size_t n = 60) {
	std::vector<double> x1, x2, y;
	for (std::size_t i = 0; i < n; ++i) {
		const double v = static_cast<double>(i);
		x1.push_back(v);
		x2.push_back(static_cast<double>((i * 7) % 11));
		y.push_back(3.0 * v + 0.1 * static_cast<double>(i % 3));
	}
	return tests::helpers::makeCleaned({{"x1", x1}, {"x2", x2}, {"y", y}});
}

} // namespace

TEST_CASE("RandomForest results do not depend on the thread count", "[models][forest]") {
	const auto table = signalTable();

	ForestOptions options;
	options.n_trees = 24;
	options.seed = 5;

	options.n_threads = 1;
	RandomForest serial(options);
	const auto serial_result = serial.fit(table, "y", {"x1", "x2"});

	options.n_threads = 4;
	RandomForest parallel(options);
	const auto parallel_result = parallel.fit(table, "y", {"x1", "x2"});

	REQUIRE(serial_result.fitted == parallel_result.fitted);
	REQUIRE(serial_result.importances == parallel_result.importances);
	REQUIRE(serial.trees().size() == 24);
}

TEST_CASE("RandomForest with a different seed grows different trees", "[models][forest]") {
	const auto table = signalTable();

	ForestOptions options;
	options.n_trees = 10;
	options.n_threads = 1;
	options.seed = 1;
	RandomForest first(options);
	options.seed = 2;
	RandomForest second(options);

	const auto a = first.fit(table, "y", {"x1", "x2"});
	const auto b = second.fit(table, "y", {"x1", "x2"});
	REQUIRE(a.fitted != b.fitted);
}

TEST_CASE("RandomForest importances favour the informative feature", "[models][forest]") {
	const auto table = signalTable();

	ForestOptions options;
	options.n_trees = 30;
	options.max_features_fraction = 1.0;
	options.n_threads = 2;
	RandomForest forest(options);
	const auto &result = forest.fit(table, "y", {"x1", "x2"});

	REQUIRE(result.features == std::vector<std::string>{"x1", "x2"});
	REQUIRE(result.max_features == 2);
	REQUIRE(result.n_trees == 30);
	const double total = std::accumulate(result.importances.begin(), result.importances.end(), 0.0);
	REQUIRE(total == Catch::Detail::Approx(1.0));
	REQUIRE(result.importance("x1") > 0.8);
	REQUIRE(result.importance("x1") > result.importance("x2"));
	REQUIRE_THROWS_AS(result.importance("x3"), MissingColumnError);

	REQUIRE(result.fitted.size() == 60);
	REQUIRE(result.metrics.n == 60);
	REQUIRE(result.metrics.r_squared.has_value());
	REQUIRE(*result.metrics.r_squared > 0.95);
}

TEST_CASE("RandomForest predicts new rows", "[models][forest]") {
	const auto table = signalTable();

	ForestOptions options;
	options.n_trees = 20;
	options.max_features_fraction = 1.0;
	RandomForest forest(options);
	forest.fit(table, "y", {"x1", "x2"});

	Eigen::MatrixXd X(2, 2);
	X << 10.0, 3.0, 50.0, 3.0;
	const auto predictions = forest.predict(X);
	REQUIRE(predictions.size() == 2);
	REQUIRE(predictions[0] == Catch::Detail::Approx(30.0).margin(6.0));
	REQUIRE(predictions[1] == Catch::Detail::Approx(150.0).margin(6.0));
	REQUIRE(predictions[0] < predictions[1]);

	REQUIRE_THROWS_AS(forest.predict(Eigen::MatrixXd::Zero(1, 3)), std::invalid_argument);
}

TEST_CASE("RandomForest samples a share of the features per split", "[models][forest]") {
	RandomForest forest;
	REQUIRE(forest.featuresPerSplit(1) == 1);
	REQUIRE(forest.featuresPerSplit(3) == 1);
	REQUIRE(forest.featuresPerSplit(4) == 2);
	REQUIRE(forest.featuresPerSplit(10) == 4);

	ForestOptions options;
	options.max_features_fraction = 1.0;
	REQUIRE(RandomForest(options).featuresPerSplit(7) == 7);
}

TEST_CASE("RandomForest rejects invalid parameters", "[models][forest]") {
	ForestOptions options;
	options.n_trees = 0;
	REQUIRE_THROWS_AS(RandomForest(options), InvalidParameterError);

	options = ForestOptions{};
	options.max_features_fraction = 0.0;
	REQUIRE_THROWS_AS(RandomForest(options), InvalidParameterError);

	options = ForestOptions{};
	options.min_samples_leaf = 0;
	REQUIRE_THROWS_AS(RandomForest(options), InvalidParameterError);

	RandomForest forest;
	const auto table = signalTable(10);
	REQUIRE_THROWS_AS(forest.fit(table, "y", {}), InvalidParameterError);
	REQUIRE_THROWS_AS(forest.fit(table, "y", {"x1", "y"}), InvalidParameterError);
	REQUIRE_THROWS_AS(forest.fit(table, "y", {"missing"}), MissingColumnError);
	REQUIRE_THROWS_AS(forest.result(), std::logic_error);
	REQUIRE_THROWS_AS(forest.predict(Eigen::MatrixXd::Zero(1, 2)), std::logic_error);
}

TEST_CASE("RandomForest needs at least two rows", "[models][forest]") {
	RandomForest forest;
	const auto one_row = tests::helpers::makeCleaned({{"x", {1.0}}, {"y", {2.0}}});
	REQUIRE_THROWS_AS(forest.fit(one_row, "y", {"x"}), InsufficientDataError);

	const auto empty = tests::helpers::makeCleaned({{"x", {}}, {"y", {}}});
	REQUIRE_THROWS_AS(forest.fit(empty, "y", {"x"}), InsufficientDataError);
}
