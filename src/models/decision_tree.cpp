#include "tabstat/models/decision_tree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace tabstat::models {

RegressionTree::RegressionTree(TreeOptions options) : options_(options) {
	if (options_.min_samples_split < 2) {
		throw std::invalid_argument("min_samples_split must be at least 2.");
	}
	if (options_.min_samples_leaf < 1) {
		throw std::invalid_argument("min_samples_leaf must be at least 1.");
	}
	if (options_.max_depth < -1) {
		throw std::invalid_argument("max_depth must be -1 (unlimited) or non-negative.");
	}
	if (options_.max_features < 0) {
		throw std::invalid_argument("max_features must be non-negative.");
	}
}

std::size_t RegressionTree::leafCount() const {
	return static_cast<std::size_t>(
	    std::count_if(nodes_.begin(), nodes_.end(), [](const Node &node) { return node.feature < 0; }));
}

void RegressionTree::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, std::vector<std::size_t> rows,
                         std::mt19937_64 &rng) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("RegressionTree: X and y must have the same number of rows.");
	}
	if (rows.empty()) {
		throw std::invalid_argument("RegressionTree: cannot fit on an empty sample.");
	}
	for (auto r : rows) {
		if (r >= static_cast<std::size_t>(y.size())) {
			throw std::out_of_range("RegressionTree: sample row index out of range.");
		}
	}

	nodes_.clear();
	impurity_decrease_.assign(static_cast<std::size_t>(X.cols()), 0.0);
	depth_ = 0;

	struct Task {
		int node;
		std::size_t begin;
		std::size_t end;
		int depth;
	};
	std::vector<Task> stack;
	nodes_.emplace_back();
	stack.push_back({0, 0, rows.size(), 0});

	const auto min_leaf = static_cast<std::size_t>(options_.min_samples_leaf);
	const auto min_split = static_cast<std::size_t>(options_.min_samples_split);

	while (!stack.empty()) {
		const Task task = stack.back();
		stack.pop_back();

		const std::size_t count = task.end - task.begin;
		double sum = 0.0;
		for (std::size_t i = task.begin; i < task.end; ++i) {
			sum += y(static_cast<Eigen::Index>(rows[i]));
		}
		const double mean = sum / static_cast<double>(count);
		double sse = 0.0;
		for (std::size_t i = task.begin; i < task.end; ++i) {
			const double diff = y(static_cast<Eigen::Index>(rows[i])) - mean;
			sse += diff * diff;
		}

		nodes_[static_cast<std::size_t>(task.node)].value = mean;
		nodes_[static_cast<std::size_t>(task.node)].samples = count;
		depth_ = std::max(depth_, task.depth);

		const bool depth_reached = options_.max_depth >= 0 && task.depth >= options_.max_depth;
		const double pure_tolerance =
		    std::numeric_limits<double>::epsilon() * static_cast<double>(count) * std::max(1.0, mean * mean);
		if (depth_reached || count < min_split || count < 2 * min_leaf || sse <= pure_tolerance) {
			continue;
		}

		const Split split = findBestSplit(X, y, rows.data() + task.begin, count, sse, rng);
		if (split.feature < 0) {
			continue;
		}

		const auto middle = std::stable_partition(
		    rows.begin() + static_cast<std::ptrdiff_t>(task.begin), rows.begin() + static_cast<std::ptrdiff_t>(task.end),
		    [&](std::size_t r) { return X(static_cast<Eigen::Index>(r), split.feature) <= split.threshold; });
		const auto mid = static_cast<std::size_t>(middle - rows.begin());

		impurity_decrease_[static_cast<std::size_t>(split.feature)] += split.gain;

		const int left = static_cast<int>(nodes_.size());
		nodes_.emplace_back();
		const int right = static_cast<int>(nodes_.size());
		nodes_.emplace_back();

		auto &node = nodes_[static_cast<std::size_t>(task.node)];
		node.feature = split.feature;
		node.threshold = split.threshold;
		node.left = left;
		node.right = right;

		stack.push_back({right, mid, task.end, task.depth + 1});
		stack.push_back({left, task.begin, mid, task.depth + 1});
	}
}

RegressionTree::Split RegressionTree::findBestSplit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                    const std::size_t *rows, std::size_t count, double node_sse,
                                                    std::mt19937_64 &rng) const {
	const auto n_features = static_cast<int>(X.cols());
	std::vector<int> features(static_cast<std::size_t>(n_features));
	std::iota(features.begin(), features.end(), 0);
	std::shuffle(features.begin(), features.end(), rng);

	const int limit = options_.max_features <= 0 ? n_features : std::min(options_.max_features, n_features);
	const auto min_leaf = static_cast<std::size_t>(options_.min_samples_leaf);

	double node_mean = 0.0;
	for (std::size_t i = 0; i < count; ++i) {
		node_mean += y(static_cast<Eigen::Index>(rows[i]));
	}
	node_mean /= static_cast<double>(count);

	Split best;
	// Splits must beat floating point noise to count as an improvement.
	best.gain = node_sse * 1e-12;

	std::vector<std::pair<double, double>> sorted(count);
	for (int k = 0; k < n_features; ++k) {
		// Past the sampled features, keep looking only until some valid split exists.
		if (k >= limit && best.feature >= 0) {
			break;
		}
		const int feature = features[static_cast<std::size_t>(k)];
		for (std::size_t i = 0; i < count; ++i) {
			const auto r = static_cast<Eigen::Index>(rows[i]);
			sorted[i] = {X(r, feature), y(r) - node_mean};
		}
		std::sort(sorted.begin(), sorted.end(),
		          [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });
		if (!(sorted.front().first < sorted.back().first)) {
			continue;
		}

		double total_sum = 0.0;
		double total_sq = 0.0;
		for (const auto &entry : sorted) {
			total_sum += entry.second;
			total_sq += entry.second * entry.second;
		}

		double left_sum = 0.0;
		double left_sq = 0.0;
		for (std::size_t s = 1; s < count; ++s) {
			left_sum += sorted[s - 1].second;
			left_sq += sorted[s - 1].second * sorted[s - 1].second;
			if (s < min_leaf || count - s < min_leaf) {
				continue;
			}
			if (!(sorted[s - 1].first < sorted[s].first)) {
				continue;
			}
			const auto n_left = static_cast<double>(s);
			const auto n_right = static_cast<double>(count - s);
			const double right_sum = total_sum - left_sum;
			const double right_sq = total_sq - left_sq;
			const double sse_left = std::max(0.0, left_sq - left_sum * left_sum / n_left);
			const double sse_right = std::max(0.0, right_sq - right_sum * right_sum / n_right);
			const double gain = node_sse - (sse_left + sse_right);
			if (gain > best.gain) {
				double threshold = sorted[s - 1].first + (sorted[s].first - sorted[s - 1].first) / 2.0;
				if (!(threshold < sorted[s].first)) {
					threshold = sorted[s - 1].first;
				}
				best.feature = feature;
				best.threshold = threshold;
				best.gain = gain;
			}
		}
	}
	return best;
}

double RegressionTree::predict(const Eigen::Ref<const Eigen::RowVectorXd> &row) const {
	if (nodes_.empty()) {
		throw std::logic_error("RegressionTree: call fit() before predict().");
	}
	std::size_t id = 0;
	while (nodes_[id].feature >= 0) {
		const auto &node = nodes_[id];
		id = static_cast<std::size_t>(row(node.feature) <= node.threshold ? node.left : node.right);
	}
	return nodes_[id].value;
}

} // namespace tabstat::models
