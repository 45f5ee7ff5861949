#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <random>
#include <vector>

namespace tabstat::models {

struct TreeOptions {
	int max_depth = -1;         // -1 grows until leaves are pure or too small
	int min_samples_split = 2;
	int min_samples_leaf = 1;
	int max_features = 0;       // features sampled per split, 0 = all
};

/**
 * CART regression tree with the squared-error split criterion.
 *
 * Nodes live in a flat vector; children are referenced by index. Thresholds
 * sit halfway between adjacent distinct feature values and rows go left when
 * their value is less than or equal to the threshold.
 */
class RegressionTree {
public:
	explicit RegressionTree(TreeOptions options = {});

	/**
	 * @brief Grows the tree on the given rows of X (repeats allowed, as in a bootstrap sample).
	 *
	 * `rng` drives the per-split feature sampling only.
	 */
	void fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, std::vector<std::size_t> rows, std::mt19937_64 &rng);

	double predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const;

	/**
	 * @brief Total squared-error reduction contributed by each feature.
	 */
	const std::vector<double> &impurityDecrease() const {
		return impurity_decrease_;
	}

	std::size_t nodeCount() const {
		return nodes_.size();
	}
	std::size_t leafCount() const;
	int depth() const {
		return depth_;
	}

private:
	struct Node {
		int feature = -1; // -1 marks a leaf
		double threshold = 0.0;
		int left = -1;
		int right = -1;
		double value = 0.0;
		std::size_t samples = 0;
	};

	struct Split {
		int feature = -1;
		double threshold = 0.0;
		double gain = 0.0;
	};

	Split findBestSplit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const std::size_t *rows,
	                    std::size_t count, double node_sse, std::mt19937_64 &rng) const;

	TreeOptions options_;
	std::vector<Node> nodes_;
	std::vector<double> impurity_decrease_;
	int depth_ = 0;
};

} // namespace tabstat::models
