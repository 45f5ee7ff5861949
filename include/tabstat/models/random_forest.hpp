#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"
#include "tabstat/models/decision_tree.hpp"
#include "tabstat/utils/metrics.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tabstat::models {

struct ForestOptions {
	int n_trees = 100;
	// Share of the features sampled at each split, rounded up to at least one feature.
	double max_features_fraction = 1.0 / 3.0;
	int max_depth = -1;
	int min_samples_split = 2;
	int min_samples_leaf = 1;
	std::uint64_t seed = 42;
	// Worker threads; 0 uses the hardware concurrency.
	unsigned n_threads = 0;
};

struct ForestResult {
	std::vector<std::string> features;
	// Aligned with `features`; sums to 1 unless no tree ever split.
	std::vector<double> importances;
	utils::AccuracyMetrics metrics;
	std::vector<double> fitted;
	int n_trees = 0;
	int max_features = 0;

	/**
	 * @throws MissingColumnError when `feature` was not part of the fit.
	 */
	double importance(const std::string &feature) const;
};

/**
 * Bagged ensemble of CART regression trees.
 *
 * Tree i draws its bootstrap sample and feature subsets from a generator seeded
 * with (seed, i), and the trees are combined in index order, so results do not
 * depend on how many threads grow them.
 */
class RandomForest {
public:
	explicit RandomForest(ForestOptions options = {});

	/**
	 * @throws InvalidParameterError, MissingColumnError, InsufficientDataError
	 */
	const ForestResult &fit(const cleaning::CleanedTable &table, const std::string &target,
	                        const std::vector<std::string> &features);

	const ForestResult &fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                        std::vector<std::string> feature_names);

	std::vector<double> predict(const Eigen::MatrixXd &X) const;

	const ForestResult &result() const;

	const ForestOptions &options() const {
		return options_;
	}
	const std::vector<RegressionTree> &trees() const {
		return trees_;
	}

	/**
	 * @brief Features considered per split for a model with `n_features` inputs.
	 */
	int featuresPerSplit(int n_features) const;

private:
	void growTrees(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const TreeOptions &tree_options);

	ForestOptions options_;
	std::vector<RegressionTree> trees_;
	ForestResult result_;
	bool is_fitted_ = false;
};

} // namespace tabstat::models
