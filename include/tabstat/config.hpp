#pragma once

#include "tabstat/cleaning/tabular_cleaner.hpp"
#include "tabstat/models/forecaster.hpp"
#include "tabstat/models/random_forest.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <optional>

namespace tabstat {

/**
 * @class AnalysisConfig
 * @brief Tunables shared by every analysis an Analyzer runs.
 *
 * Setters validate their argument and throw InvalidParameterError, so a config
 * that exists is always usable. Nothing is read from the environment.
 */
class AnalysisConfig {
public:
	AnalysisConfig() = default;

	AnalysisConfig &setSeed(std::uint64_t seed);
	AnalysisConfig &setTrees(int n_trees);
	AnalysisConfig &setMaxFeaturesFraction(double fraction);
	/// -1 grows trees until the leaves are pure or too small to split.
	AnalysisConfig &setMaxDepth(int max_depth);
	AnalysisConfig &setMinSamplesSplit(int min_samples_split);
	AnalysisConfig &setMinSamplesLeaf(int min_samples_leaf);
	/// 0 uses the hardware concurrency.
	AnalysisConfig &setThreads(unsigned n_threads);
	AnalysisConfig &setMaxP(int max_p);
	AnalysisConfig &setMaxQ(int max_q);
	AnalysisConfig &setMaxD(int max_d);
	AnalysisConfig &setMaxModels(int max_models);
	AnalysisConfig &setDuplicatePolicy(cleaning::DuplicateTimestampPolicy policy);
	/// Applied to the shared logger when an Analyzer is constructed.
	AnalysisConfig &setLogLevel(spdlog::level::level_enum level);

	std::uint64_t seed() const {
		return seed_;
	}
	int trees() const {
		return n_trees_;
	}
	cleaning::DuplicateTimestampPolicy duplicatePolicy() const {
		return duplicate_policy_;
	}
	std::optional<spdlog::level::level_enum> logLevel() const {
		return log_level_;
	}
	unsigned threads() const {
		return n_threads_;
	}

	/// Forest options for `n_trees` trees; the other fields come from this config.
	models::ForestOptions forestOptions(int n_trees) const;
	models::ForecasterOptions forecasterOptions() const;

private:
	std::uint64_t seed_ = 42;
	int n_trees_ = 100;
	double max_features_fraction_ = 1.0 / 3.0;
	int max_depth_ = -1;
	int min_samples_split_ = 2;
	int min_samples_leaf_ = 1;
	unsigned n_threads_ = 0;
	int max_p_ = 5;
	int max_q_ = 5;
	int max_d_ = 2;
	int max_models_ = 94;
	cleaning::DuplicateTimestampPolicy duplicate_policy_ = cleaning::DuplicateTimestampPolicy::Mean;
	std::optional<spdlog::level::level_enum> log_level_;
};

} // namespace tabstat
