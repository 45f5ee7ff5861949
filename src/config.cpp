#include "tabstat/config.hpp"

#include "tabstat/core/errors.hpp"

#include <string>

namespace tabstat {

AnalysisConfig &AnalysisConfig::setSeed(std::uint64_t seed) {
	seed_ = seed;
	return *this;
}

AnalysisConfig &AnalysisConfig::setTrees(int n_trees) {
	if (n_trees <= 0) {
		throw InvalidParameterError("n_trees must be positive, got " + std::to_string(n_trees));
	}
	n_trees_ = n_trees;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxFeaturesFraction(double fraction) {
	if (!(fraction > 0.0 && fraction <= 1.0)) {
		throw InvalidParameterError("max_features fraction must be in (0, 1]");
	}
	max_features_fraction_ = fraction;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxDepth(int max_depth) {
	if (max_depth < -1) {
		throw InvalidParameterError("max_depth must be -1 (unlimited) or non-negative");
	}
	max_depth_ = max_depth;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMinSamplesSplit(int min_samples_split) {
	if (min_samples_split < 2) {
		throw InvalidParameterError("min_samples_split must be at least 2");
	}
	min_samples_split_ = min_samples_split;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMinSamplesLeaf(int min_samples_leaf) {
	if (min_samples_leaf < 1) {
		throw InvalidParameterError("min_samples_leaf must be at least 1");
	}
	min_samples_leaf_ = min_samples_leaf;
	return *this;
}

AnalysisConfig &AnalysisConfig::setThreads(unsigned n_threads) {
	n_threads_ = n_threads;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxP(int max_p) {
	if (max_p < 0) {
		throw InvalidParameterError("max_p must be non-negative");
	}
	max_p_ = max_p;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxQ(int max_q) {
	if (max_q < 0) {
		throw InvalidParameterError("max_q must be non-negative");
	}
	max_q_ = max_q;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxD(int max_d) {
	if (max_d < 0 || max_d > 2) {
		throw InvalidParameterError("max_d must be 0, 1 or 2");
	}
	max_d_ = max_d;
	return *this;
}

AnalysisConfig &AnalysisConfig::setMaxModels(int max_models) {
	if (max_models <= 0) {
		throw InvalidParameterError("max_models must be positive");
	}
	max_models_ = max_models;
	return *this;
}

AnalysisConfig &AnalysisConfig::setDuplicatePolicy(cleaning::DuplicateTimestampPolicy policy) {
	duplicate_policy_ = policy;
	return *this;
}

AnalysisConfig &AnalysisConfig::setLogLevel(spdlog::level::level_enum level) {
	if (level < spdlog::level::trace || level > spdlog::level::off) {
		throw InvalidParameterError("unknown log level");
	}
	log_level_ = level;
	return *this;
}

models::ForestOptions AnalysisConfig::forestOptions(int n_trees) const {
	models::ForestOptions options;
	options.n_trees = n_trees;
	options.max_features_fraction = max_features_fraction_;
	options.max_depth = max_depth_;
	options.min_samples_split = min_samples_split_;
	options.min_samples_leaf = min_samples_leaf_;
	options.seed = seed_;
	options.n_threads = n_threads_;
	return options;
}

models::ForecasterOptions AnalysisConfig::forecasterOptions() const {
	models::ForecasterOptions options;
	options.max_p = max_p_;
	options.max_q = max_q_;
	options.max_d = max_d_;
	options.max_models = max_models_;
	options.n_threads = n_threads_;
	return options;
}

} // namespace tabstat
