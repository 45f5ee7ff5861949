#include <catch2/catch.hpp>

#include "tabstat/models/decision_tree.hpp"

#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

using tabstat::models::RegressionTree;
using tabstat::models::TreeOptions;

namespace {

std::vector<std::size_t> allRows(std::size_t n) {
	std::vector<std::size_t> rows(n);
	std::iota(rows.begin(), rows.end(), std::size_t{0});
	return rows;
}

// x = 0..9 in column 0, a constant in column 1, and y jumping from 0 to 10 at x = `step_at`.
void stepData(Eigen::MatrixXd &X, Eigen::VectorXd &y, int step_at) {
	X.resize(10, 2);
	y.resize(10);
	for (int i = 0; i < 10; ++i) {
		X(i, 0) = static_cast<double>(i);
		X(i, 1) = 1.0;
		y(i) = i >= step_at ? 10.0 : 0.0;
	}
}

} // namespace

TEST_CASE("RegressionTree splits a step function once", "[models][tree]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	stepData(X, y, 5);

	RegressionTree tree;
	std::mt19937_64 rng(1);
	tree.fit(X, y, allRows(10), rng);

	REQUIRE(tree.nodeCount() == 3);
	REQUIRE(tree.leafCount() == 2);
	REQUIRE(tree.depth() == 1);

	Eigen::RowVectorXd row(2);
	row << 2.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(0.0));
	row << 4.5, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(0.0));
	row << 4.6, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(10.0));

	// The root holds all of the squared error: 10 rows at distance 5 from the mean.
	const auto &decrease = tree.impurityDecrease();
	REQUIRE(decrease.size() == 2);
	REQUIRE(decrease[0] == Catch::Detail::Approx(250.0));
	REQUIRE(decrease[1] == 0.0);
}

TEST_CASE("RegressionTree with depth 0 predicts the sample mean", "[models][tree]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	stepData(X, y, 5);

	TreeOptions options;
	options.max_depth = 0;
	RegressionTree tree(options);
	std::mt19937_64 rng(1);
	tree.fit(X, y, allRows(10), rng);

	REQUIRE(tree.nodeCount() == 1);
	REQUIRE(tree.depth() == 0);
	Eigen::RowVectorXd row(2);
	row << 9.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(5.0));
}

TEST_CASE("RegressionTree honours min_samples_leaf", "[models][tree]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	stepData(X, y, 8);

	TreeOptions options;
	options.min_samples_leaf = 3;
	RegressionTree tree(options);
	std::mt19937_64 rng(1);
	tree.fit(X, y, allRows(10), rng);

	// Only two rows sit past the step, so the closest legal split keeps x = 7 on the right.
	Eigen::RowVectorXd row(2);
	row << 9.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(20.0 / 3.0));
	row << 0.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(0.0));
	REQUIRE(tree.leafCount() == 2);
}

TEST_CASE("RegressionTree grows on bootstrap rows with repeats", "[models][tree]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	stepData(X, y, 5);

	RegressionTree tree;
	std::mt19937_64 rng(3);
	tree.fit(X, y, {0, 0, 1, 8, 8, 9}, rng);

	Eigen::RowVectorXd row(2);
	row << 1.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(0.0));
	row << 7.0, 1.0;
	REQUIRE(tree.predict(row) == Catch::Detail::Approx(10.0));
}

TEST_CASE("RegressionTree rejects bad options and input", "[models][tree]") {
	TreeOptions options;
	options.min_samples_split = 1;
	REQUIRE_THROWS_AS(RegressionTree(options), std::invalid_argument);

	options = TreeOptions{};
	options.min_samples_leaf = 0;
	REQUIRE_THROWS_AS(RegressionTree(options), std::invalid_argument);

	options = TreeOptions{};
	options.max_depth = -2;
	REQUIRE_THROWS_AS(RegressionTree(options), std::invalid_argument);

	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	stepData(X, y, 5);
	RegressionTree tree;
	std::mt19937_64 rng(1);

	Eigen::RowVectorXd row = Eigen::RowVectorXd::Zero(2);
	REQUIRE_THROWS_AS(tree.predict(row), std::logic_error);
	REQUIRE_THROWS_AS(tree.fit(X, y, {}, rng), std::invalid_argument);
	REQUIRE_THROWS_AS(tree.fit(X, y, {10}, rng), std::out_of_range);
	REQUIRE_THROWS_AS(tree.fit(X, Eigen::VectorXd::Zero(3), allRows(3), rng), std::invalid_argument);
}
