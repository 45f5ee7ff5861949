#include "tabstat/models/random_forest.hpp"

#include "tabstat/core/errors.hpp"
#include "tabstat/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>

namespace tabstat::models {

namespace {

std::mt19937_64 treeGenerator(std::uint64_t seed, std::size_t tree_index) {
	std::seed_seq sequence{static_cast<std::uint32_t>(seed & 0xffffffffULL), static_cast<std::uint32_t>(seed >> 32),
	                       static_cast<std::uint32_t>(tree_index & 0xffffffffULL),
	                       static_cast<std::uint32_t>(static_cast<std::uint64_t>(tree_index) >> 32)};
	return std::mt19937_64(sequence);
}

} // namespace

double ForestResult::importance(const std::string &feature) const {
	const auto it = std::find(features.begin(), features.end(), feature);
	if (it == features.end()) {
		throw MissingColumnError(feature);
	}
	return importances[static_cast<std::size_t>(std::distance(features.begin(), it))];
}

RandomForest::RandomForest(ForestOptions options) : options_(options) {
	if (options_.n_trees <= 0) {
		throw InvalidParameterError("n_trees must be positive, got " + std::to_string(options_.n_trees));
	}
	if (!(options_.max_features_fraction > 0.0 && options_.max_features_fraction <= 1.0)) {
		throw InvalidParameterError("max_features_fraction must be in (0, 1]");
	}
	if (options_.max_depth < -1) {
		throw InvalidParameterError("max_depth must be -1 (unlimited) or non-negative");
	}
	if (options_.min_samples_split < 2 || options_.min_samples_leaf < 1) {
		throw InvalidParameterError("min_samples_split must be >= 2 and min_samples_leaf >= 1");
	}
}

int RandomForest::featuresPerSplit(int n_features) const {
	const int k = static_cast<int>(std::ceil(options_.max_features_fraction * static_cast<double>(n_features)));
	return std::max(1, std::min(k, n_features));
}

const ForestResult &RandomForest::fit(const cleaning::CleanedTable &table, const std::string &target,
                                      const std::vector<std::string> &features) {
	if (features.empty()) {
		throw InvalidParameterError("at least one feature is required");
	}
	if (std::find(features.begin(), features.end(), target) != features.end()) {
		throw InvalidParameterError("target '" + target + "' cannot also be a feature");
	}

	const auto &y_values = table.column(target);
	const auto n = static_cast<Eigen::Index>(table.rowCount());
	Eigen::MatrixXd X(n, static_cast<Eigen::Index>(features.size()));
	for (std::size_t j = 0; j < features.size(); ++j) {
		const auto &column = table.column(features[j]);
		X.col(static_cast<Eigen::Index>(j)) = Eigen::Map<const Eigen::VectorXd>(column.data(), n);
	}
	const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(y_values.data(), n);
	return fit(X, y, features);
}

const ForestResult &RandomForest::fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                      std::vector<std::string> feature_names) {
	if (X.rows() != y.size() || static_cast<Eigen::Index>(feature_names.size()) != X.cols()) {
		throw std::invalid_argument("RandomForest: X, y and feature names disagree in shape.");
	}
	if (X.cols() == 0) {
		throw InvalidParameterError("at least one feature is required");
	}
	if (y.size() < 2) {
		throw InsufficientDataError("random forest needs at least 2 rows, got " + std::to_string(y.size()));
	}

	TreeOptions tree_options;
	tree_options.max_depth = options_.max_depth;
	tree_options.min_samples_split = options_.min_samples_split;
	tree_options.min_samples_leaf = options_.min_samples_leaf;
	tree_options.max_features = featuresPerSplit(static_cast<int>(X.cols()));

	growTrees(X, y, tree_options);

	ForestResult result;
	result.features = std::move(feature_names);
	result.n_trees = options_.n_trees;
	result.max_features = tree_options.max_features;

	// Per-tree normalisation first, then the average is renormalised.
	const auto p = static_cast<std::size_t>(X.cols());
	result.importances.assign(p, 0.0);
	for (const auto &tree : trees_) {
		const auto &decrease = tree.impurityDecrease();
		double total = 0.0;
		for (double d : decrease) {
			total += d;
		}
		if (total <= 0.0) {
			continue;
		}
		for (std::size_t j = 0; j < p; ++j) {
			result.importances[j] += decrease[j] / total;
		}
	}
	double importance_total = 0.0;
	for (double v : result.importances) {
		importance_total += v;
	}
	if (importance_total > 0.0) {
		for (double &v : result.importances) {
			v /= importance_total;
		}
	}

	result.fitted = predict(X);
	const std::vector<double> actual(y.data(), y.data() + y.size());
	result.metrics = utils::Metrics::summarize(actual, result.fitted);

	TABSTAT_DEBUG("Random forest grew {} trees on {} rows ({} features, {} per split), in-sample RMSE {:.4f}",
	              result.n_trees, y.size(), p, result.max_features, result.metrics.rmse);

	result_ = std::move(result);
	is_fitted_ = true;
	return result_;
}

void RandomForest::growTrees(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const TreeOptions &tree_options) {
	const auto n_trees = static_cast<std::size_t>(options_.n_trees);
	const auto n_rows = static_cast<std::size_t>(y.size());

	std::vector<RegressionTree> trees(n_trees, RegressionTree(tree_options));
	std::atomic<std::size_t> next{0};
	std::exception_ptr failure;
	std::mutex failure_mutex;

	auto worker = [&]() {
		for (std::size_t t = next.fetch_add(1); t < n_trees; t = next.fetch_add(1)) {
			try {
				auto rng = treeGenerator(options_.seed, t);
				std::uniform_int_distribution<std::size_t> pick(0, n_rows - 1);
				std::vector<std::size_t> sample(n_rows);
				for (auto &row : sample) {
					row = pick(rng);
				}
				trees[t].fit(X, y, std::move(sample), rng);
			} catch (...) {
				std::lock_guard<std::mutex> lock(failure_mutex);
				if (!failure) {
					failure = std::current_exception();
				}
				next.store(n_trees);
			}
		}
	};

	unsigned n_threads = options_.n_threads == 0 ? std::thread::hardware_concurrency() : options_.n_threads;
	n_threads = std::max(1u, std::min<unsigned>(n_threads, static_cast<unsigned>(n_trees)));

	if (n_threads == 1) {
		worker();
	} else {
		std::vector<std::thread> pool;
		pool.reserve(n_threads);
		for (unsigned i = 0; i < n_threads; ++i) {
			pool.emplace_back(worker);
		}
		for (auto &thread : pool) {
			thread.join();
		}
	}
	if (failure) {
		std::rethrow_exception(failure);
	}
	trees_ = std::move(trees);
}

std::vector<double> RandomForest::predict(const Eigen::MatrixXd &X) const {
	if (trees_.empty()) {
		throw std::logic_error("RandomForest: call fit() before predict().");
	}
	if (static_cast<std::size_t>(X.cols()) != trees_.front().impurityDecrease().size()) {
		throw std::invalid_argument("Prediction rows must have one value per feature.");
	}
	std::vector<double> predictions(static_cast<std::size_t>(X.rows()), 0.0);
	for (Eigen::Index i = 0; i < X.rows(); ++i) {
		double sum = 0.0;
		for (const auto &tree : trees_) {
			sum += tree.predict(X.row(i));
		}
		predictions[static_cast<std::size_t>(i)] = sum / static_cast<double>(trees_.size());
	}
	return predictions;
}

const ForestResult &RandomForest::result() const {
	if (!is_fitted_) {
		throw std::logic_error("RandomForest: call fit() before accessing results.");
	}
	return result_;
}

} // namespace tabstat::models
